#include "repl.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>

#include "node_page.h"
#include "row.h"

/**
 * Parses "insert <id> <username> <email>".
 *
 * The fields are separated by whitespace. Anything after the email is
 * ignored. The id has to be a whole decimal number that fits in a u32.
 */
static PrepareResult PrepareInsert(const std::string &line,
                                   Statement &statement) {
  std::istringstream fields(line);
  std::string keyword, id_string, username, email;
  if (!(fields >> keyword >> id_string >> username >> email)) {
    return PrepareResult::kSyntaxError;
  }

  errno = 0;
  char *end = nullptr;
  long long id = std::strtoll(id_string.c_str(), &end, 10);
  if (end == id_string.c_str() || *end != '\0' || errno == ERANGE) {
    return PrepareResult::kSyntaxError;
  }
  if (id < 0) {
    return PrepareResult::kNegativeId;
  }
  if (id > 0xFFFFFFFFLL) {
    return PrepareResult::kSyntaxError;
  }
  if (username.size() > kColumnUsernameSize ||
      email.size() > kColumnEmailSize) {
    return PrepareResult::kStringTooLong;
  }

  statement.type = StatementType::kInsert;
  if (!MakeRow(static_cast<u32>(id), username, email,
               statement.row_to_insert)) {
    return PrepareResult::kStringTooLong;
  }
  return PrepareResult::kSuccess;
}

PrepareResult PrepareStatement(const std::string &line, Statement &statement) {
  std::istringstream fields(line);
  std::string keyword;
  fields >> keyword;
  if (keyword == "insert") {
    return PrepareInsert(line, statement);
  }
  if (line == "select") {
    statement.type = StatementType::kSelect;
    return PrepareResult::kSuccess;
  }
  return PrepareResult::kUnrecognizedStatement;
}

void PrintConstants(std::ostream &out) {
  out << "ROW_SIZE: " << kRowSize << "\n";
  out << "COMMON_NODE_HEADER_SIZE: " << kCommonNodeHeaderSize << "\n";
  out << "LEAF_NODE_HEADER_SIZE: " << kLeafNodeHeaderSize << "\n";
  out << "LEAF_NODE_CELL_SIZE: " << kLeafNodeCellSize << "\n";
  out << "LEAF_NODE_SPACE_FOR_CELLS: " << kLeafNodeSpaceForCells << "\n";
  out << "LEAF_NODE_MAX_CELLS: " << kLeafNodeMaxCells << "\n";
}

MetaCommandResult DoMetaCommand(const std::string &line, Table &table,
                                std::ostream &out) {
  if (line == ".exit") {
    return MetaCommandResult::kExit;
  }
  if (line == ".btree") {
    out << "Tree:\n";
    ResultCode rc = table.GetBtree().BtreeDump(out);
    if (rc != ResultCode::kOk) {
      out << "Error: " << rc << ".\n";
    }
    return MetaCommandResult::kSuccess;
  }
  if (line == ".constants") {
    out << "Constants:\n";
    PrintConstants(out);
    return MetaCommandResult::kSuccess;
  }
  return MetaCommandResult::kUnrecognizedCommand;
}

// Trailing whitespace, including the '\r' of a CRLF line, is not part of
// the command
static void TrimLineEnd(std::string &line) {
  std::size_t end = line.find_last_not_of(" \t\r\n");
  line.erase(end == std::string::npos ? 0 : end + 1);
}

// Closes the table on the way out. A failed flush turns into a failed exit.
static int CloseAndExit(Table &table, std::ostream &out, int status) {
  ResultCode rc = table.TableClose();
  if (rc != ResultCode::kOk) {
    out << "Error: " << rc << ".\n";
    return 1;
  }
  return status;
}

int RunRepl(Table &table, std::istream &in, std::ostream &out) {
  std::string line;
  while (true) {
    out << "db > " << std::flush;
    if (!std::getline(in, line)) {
      // End of input behaves like .exit
      return CloseAndExit(table, out, 0);
    }
    TrimLineEnd(line);

    if (!line.empty() && line[0] == '.') {
      switch (DoMetaCommand(line, table, out)) {
        case MetaCommandResult::kSuccess:
          continue;
        case MetaCommandResult::kExit:
          return CloseAndExit(table, out, 0);
        case MetaCommandResult::kUnrecognizedCommand:
          out << "Unrecognized command '" << line << "'\n";
          continue;
      }
    }

    Statement statement;
    switch (PrepareStatement(line, statement)) {
      case PrepareResult::kSuccess:
        break;
      case PrepareResult::kNegativeId:
        out << "ID must be positive.\n";
        continue;
      case PrepareResult::kStringTooLong:
        out << "String is too long.\n";
        continue;
      case PrepareResult::kSyntaxError:
        out << "Syntax error. Could not parse statement.\n";
        continue;
      case PrepareResult::kUnrecognizedStatement:
        out << "Unrecognized keyword at start of '" << line << "'.\n";
        continue;
    }

    ResultCode rc = table.TableExecute(
        statement, [&out](const Row &row) { out << ToString(row) << "\n"; });
    switch (rc) {
      case ResultCode::kOk:
        out << "Executed.\n";
        break;
      case ResultCode::kConstraintPrimaryKey:
        out << "Error: Duplicate key.\n";
        break;
      case ResultCode::kFull:
        out << "Error: Table full.\n";
        return CloseAndExit(table, out, 1);
      default:
        out << "Error: " << rc << ".\n";
        break;
    }
  }
}
