#include "tmbdd/errors.hpp"
#include "tmbdd/hlcompiler.hpp"
#include "tmbdd/parser.hpp"
#include "tmbdd/simulator.hpp"

#include <iostream>
#include <fstream>
#include <sstream>

void PrintUsage(const char* prog) {
  std::cerr << "tmbdd - register machine to two-symbol Turing machine compiler\n\n";
  std::cerr << "Usage: " << prog << " [options] <source.nql>\n";
  std::cerr << "\nOptions:\n";
  std::cerr << "  --print-tm        Print the state table\n";
  std::cerr << "  --print-subs      Print the subprogram tree\n";
  std::cerr << "  --run-tm          Run the machine and print the globals\n";
  std::cerr << "  --trace           Print every step while running\n";
  std::cerr << "  --max-steps <n>   Step limit for --run-tm (default 100000000)\n";
  std::cerr << "  --no-compress     Keep duplicate states\n";
  std::cerr << "  --no-cfg-opt      Disable goto threading\n";
  std::cerr << "  --branch-adder    Branch by relative add instead of bit patching\n";
  std::cerr << "  -o <file>         Write the state table to a file\n";
  std::cerr << "  -v                Verbose output\n";
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string input_file;
  std::string output_file;
  bool verbose = false;
  bool print_tm = false;
  bool print_subs = false;
  bool run_tm = false;
  bool trace = false;
  bool compress = true;
  std::string max_steps_arg;
  tmbdd::MachineOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-o" && i + 1 < argc) {
      output_file = argv[++i];
    } else if (arg == "-v") {
      verbose = true;
    } else if (arg == "--print-tm") {
      print_tm = true;
    } else if (arg == "--print-subs") {
      print_subs = true;
    } else if (arg == "--run-tm") {
      run_tm = true;
    } else if (arg == "--trace") {
      trace = true;
      run_tm = true;
    } else if (arg == "--no-compress") {
      compress = false;
    } else if (arg == "--no-cfg-opt") {
      options.optimize_cfg = false;
    } else if (arg == "--branch-adder") {
      options.branch_mode = tmbdd::BranchMode::kAdder;
    } else if (arg == "--max-steps" && i + 1 < argc) {
      max_steps_arg = argv[++i];
    } else if (arg[0] != '-') {
      input_file = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }

  if (input_file.empty()) {
    std::cerr << "Error: No input file specified\n";
    PrintUsage(argv[0]);
    return 1;
  }

  // Read input file
  std::ifstream ifs(input_file);
  if (!ifs) {
    std::cerr << "Error: Cannot open input file: " << input_file << "\n";
    return 1;
  }
  std::stringstream buffer;
  buffer << ifs.rdbuf();
  std::string source = buffer.str();

  try {
    long long max_steps = 100000000;
    if (!max_steps_arg.empty()) max_steps = std::stoll(max_steps_arg);

    if (verbose) std::cerr << "Parsing " << input_file << "...\n";
    tmbdd::Program program = tmbdd::Parse(source);

    if (verbose) std::cerr << "Compiling to TM...\n";
    options.compress = false;
    tmbdd::Machine machine = tmbdd::CompileProgram(program, options);
    if (verbose) {
      std::cerr << "  pc_bits: " << machine.pc_bits() << "\n";
      std::cerr << "  Registers: " << machine.builder().register_names().size() << "\n";
      std::cerr << "  States: " << machine.state_count() << "\n";
    }

    if (compress) {
      if (verbose) std::cerr << "Compressing...\n";
      int rounds = machine.Compress();
      if (verbose) {
        std::cerr << "  Rounds: " << rounds << "\n";
        std::cerr << "  States: " << machine.state_count() << "\n";
      }
    }

    if (print_subs) {
      machine.PrintSubs(std::cout);
    }

    if (print_tm) {
      machine.PrintMachine(std::cout);
    }

    if (!output_file.empty()) {
      std::ofstream ofs(output_file);
      if (!ofs) {
        std::cerr << "Error: Cannot open output file: " << output_file << "\n";
        return 1;
      }
      machine.PrintMachine(ofs);
      if (verbose) std::cerr << "Wrote " << output_file << "\n";
    }

    if (run_tm) {
      if (verbose) std::cerr << "Running...\n";
      if (trace) {
        while (!machine.Halted() && machine.Steps() < max_steps) {
          std::cout << machine.TraceLine() << "\n";
          machine.Step();
        }
      }
      tmbdd::RunResult result = machine.Run(max_steps);

      for (const auto& global : program.globals) {
        std::cout << global.name << " = "
                  << machine.RegisterValue(tmbdd::GlobalRegisterName(global.name)) << "\n";
      }
      std::cout << "Steps: " << result.steps << "\n";
      if (result.hit_limit) {
        std::cout << "WARNING: Hit step limit\n";
      }
    }

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
