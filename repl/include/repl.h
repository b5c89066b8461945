#pragma once

#include <istream>
#include <ostream>
#include <string>

#include "table.h"

/*
 * repl.h
 *
 * The line-oriented front end: reads commands, turns them into Statements
 * for the Table, and prints the results.
 *
 * A line starting with '.' is a meta-command (.exit, .btree, .constants).
 * Anything else must be one of
 *   insert <id> <username> <email>
 *   select
 */

enum class PrepareResult {
  kSuccess,
  kNegativeId,
  kStringTooLong,
  kSyntaxError,
  kUnrecognizedStatement,
};

enum class MetaCommandResult {
  kSuccess,
  kExit,
  kUnrecognizedCommand,
};

// Parses one statement. statement is only meaningful on kSuccess.
PrepareResult PrepareStatement(const std::string &line, Statement &statement);

// Runs one meta-command, printing its output to out. .exit does not close the
// table, it only reports kExit.
MetaCommandResult DoMetaCommand(const std::string &line, Table &table,
                                std::ostream &out);

// Prints the layout constants shown by .constants
void PrintConstants(std::ostream &out);

// Reads lines from in until .exit or the end of input, then closes the
// table. Returns the process exit status.
int RunRepl(Table &table, std::istream &in, std::ostream &out);
