//! # Tool Driver Interface
//!
//! `embedql_main()` parses the command line, sets up logging and runs a
//! `Session` over the base directory.

#ifndef EMBEDQL_CLI_DRIVER_HPP
#define EMBEDQL_CLI_DRIVER_HPP

int embedql_main(int argc, char* argv[]);

#endif // EMBEDQL_CLI_DRIVER_HPP
