// cgc - Code graph checker Command Line Interface
//
// Usage:
//   cgc check    <payload.json>... [--config f] [--json] [-v]
//   cgc impact   <payload.json>... --changed <file>... [--json]
//   cgc change   <payload.json>... --entity <id> [--type delete] [--new-name n] [--json]
//   cgc snapshot <payload.json>... -o <snapshot.json> [--label L]
//   cgc diff     <old-snapshot.json> <new-snapshot.json> [--json]
//   cgc init
//
// Exit status: 0 when no error-severity violation was found, 1 otherwise,
// 2 on usage or input errors.
//
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "cli.hpp"

int main(int argc, char * argv[])
{
  const codegraph::cli::Console console{std::cout, std::cerr, isatty(fileno(stderr)) != 0};
  return codegraph::cli::run(argc, argv, console);
}
