//
//  main.cpp
//  Luna
//
//  Copyright (c) 2026 The Luna developers.  All rights reserved.
//

//	This file is part of Luna.
//
//	Luna is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by
//	the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
//
//	Luna is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
//	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more details.
//
//	You should have received a copy of the GNU General Public License along with Luna.  If not, see <http://www.gnu.org/licenses/>.



#include <iostream>
#include <fstream>
#include <sstream>
#include <string.h>
#include <string>
#include <vector>
#include <ctime>
#include <chrono>
#include <atomic>
#include <future>
#include <csignal>
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <sys/stat.h>

#include "luna_globals.h"
#include "luna_script.h"
#include "luna_preprocessor.h"
#include "luna_functions.h"
#include "luna_script_runner.h"
#include "luna_test.h"


// set by SIGINT; the run stops before its next logical line
static std::atomic<bool> gLunaToolCancelFlag(false);

static void LunaTool_HandleInterrupt(__attribute__((unused)) int p_signal)
{
	gLunaToolCancelFlag = true;
}

void PrintUsageAndDie();

void PrintUsageAndDie()
{
	std::cout << "usage: lunatool -version | -usage | -testLuna | [-time] [-logTokens] [-logAST] [-logEvaluation]" << std::endl;
	std::cout << "   [-define <statement>]... [<script file>]" << std::endl;
	exit(EXIT_SUCCESS);
}

int main(int argc, const char * argv[])
{
	// parse command-line arguments
	const char *input_file = nullptr;
	bool keep_time = false;
	std::vector<std::string> defined_constants;

	// "lunatool" with no arguments prints usage, *unless* stdin is not a tty, in which case we're running the stdin script
	if ((argc == 1) && isatty(fileno(stdin)))
		PrintUsageAndDie();

	for (int arg_index = 1; arg_index < argc; ++arg_index)
	{
		const char *arg = argv[arg_index];

		// -time or -t: take a time measurement and output it at the end of execution
		if (strcmp(arg, "-time") == 0 || strcmp(arg, "-t") == 0)
		{
			keep_time = true;

			continue;
		}

		// -logTokens, -logAST, -logEvaluation: diagnostic dumps of each logical line to stdout
		if (strcmp(arg, "-logTokens") == 0)
		{
			gLunaLogTokens = true;

			continue;
		}

		if (strcmp(arg, "-logAST") == 0)
		{
			gLunaLogAST = true;

			continue;
		}

		if (strcmp(arg, "-logEvaluation") == 0)
		{
			gLunaLogEvaluation = true;

			continue;
		}

		// -define or -d: run a statement such as "x=5" before the script; may be given more than once
		if (strcmp(arg, "-define") == 0 || strcmp(arg, "-d") == 0)
		{
			if (++arg_index == argc)
				PrintUsageAndDie();

			defined_constants.emplace_back(argv[arg_index]);

			continue;
		}

		// -version or -v: print version information
		if (strcmp(arg, "-version") == 0 || strcmp(arg, "-v") == 0)
		{
			std::cout << "Luna version " << LUNA_VERSION_STRING << ", built " << __DATE__ << " " __TIME__ << std::endl;
			exit(EXIT_SUCCESS);
		}

		// -testLuna or -tl: run Luna tests and quit
		if (strcmp(arg, "-testLuna") == 0 || strcmp(arg, "-tl") == 0)
		{
			int test_result = RunLunaTests();

			exit(test_result);
		}

		// -usage or -u: print usage information
		if (strcmp(arg, "-usage") == 0 || strcmp(arg, "-u") == 0 || strcmp(arg, "-?") == 0)
		{
			PrintUsageAndDie();
		}

		// this is the fall-through, which should be the input file, and should be the last argument given
		if (arg_index + 1 != argc)
			PrintUsageAndDie();

		input_file = argv[arg_index];
	}

	// check that we got what we need
	if (!input_file && isatty(fileno(stdin)))
		PrintUsageAndDie();

	// announce if we are running a debug build, etc.
#ifdef DEBUG
	std::cerr << "// ********** DEBUG defined - you are not using a release build of Luna" << std::endl << std::endl;
#endif

	// keep time (we do this whether or not the -time flag was passed)
	std::clock_t begin_cpu = std::clock();
	std::chrono::steady_clock::time_point begin_wall = std::chrono::steady_clock::now();

	// load the script
	std::string script_text;

	if (!input_file)
	{
		// no input file supplied; either the user forgot (if stdin is a tty) or they're piping a script into stdin
		// we checked for the tty case above, so here we assume stdin will supply the script
		std::stringstream buffer;

		buffer << std::cin.rdbuf();

		script_text = buffer.str();
	}
	else
	{
		// check that input_file is a valid path to a file that we can access before opening it
		{
			FILE *fp = fopen(input_file, "r");

			if (!fp)
			{
				std::cerr << "ERROR (main): could not open input file: " << input_file << "." << std::endl;
				exit(EXIT_FAILURE);
			}

			struct stat fileInfo;
			int retval = fstat(fileno(fp), &fileInfo);

			if (retval != 0)
			{
				fclose(fp);
				std::cerr << "ERROR (main): could not access input file: " << input_file << "." << std::endl;
				exit(EXIT_FAILURE);
			}

			// fifos are permitted, to allow redirection of input
			if (!S_ISREG(fileInfo.st_mode) && !S_ISFIFO(fileInfo.st_mode))
			{
				fclose(fp);
				std::cerr << "ERROR (main): input file " << input_file << " is not a regular file or a fifo (it might be a directory or other special file)." << std::endl;
				exit(EXIT_FAILURE);
			}
			fclose(fp);
		}

		std::ifstream infile(input_file);

		if (!infile.is_open())
		{
			std::cerr << "ERROR (main): could not open input file: " << input_file << "." << std::endl;
			exit(EXIT_FAILURE);
		}

		std::stringstream buffer;

		buffer << infile.rdbuf();

		script_text = buffer.str();
	}

	LunaScriptRunner runner(Luna_StandardBuiltInFunctionMap(), std::cout, std::cerr);

	// command-line defines must all succeed before the script runs
	if (!runner.DefineConstantsFromCommandLine(defined_constants))
		exit(EXIT_FAILURE);

	// run the script on its own thread, so that ^C can cancel it between lines
	std::signal(SIGINT, LunaTool_HandleInterrupt);

	std::future<LunaRunResult> run_future = runner.RunLinesInBackground(LunaPreprocessor::SplitLines(script_text), gLunaToolCancelFlag);
	LunaRunResult run_result = run_future.get();

	std::signal(SIGINT, SIG_DFL);

	// end timing and print elapsed time
	std::clock_t end_cpu = std::clock();
	std::chrono::steady_clock::time_point end_wall = std::chrono::steady_clock::now();
	double cpu_time_secs = static_cast<double>(end_cpu - begin_cpu) / CLOCKS_PER_SEC;
	double wall_time_secs = std::chrono::duration<double>(end_wall - begin_wall).count();

	if (keep_time)
	{
		std::cout << "// ********** CPU time used: " << cpu_time_secs << std::endl;
		std::cout << "// ********** Wall time used: " << wall_time_secs << std::endl;
	}

	if ((run_result == LunaRunResult::kCancelled) || runner.Errors().size())
		return EXIT_FAILURE;

	return EXIT_SUCCESS;
}
