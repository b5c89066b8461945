#include <iostream>

#include "repl.h"
#include "sql_rc.h"
#include "table.h"

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cout << "Must supply a database filename." << std::endl;
    return 1;
  }

  try {
    Table table(argv[1]);
    return RunRepl(table, std::cin, std::cout);
  } catch (const DbException &e) {
    std::cout << "Error: " << e.what() << std::endl;
    return 1;
  }
}
