//! # embedql Entry Point
//!
//! Delegates to the CLI driver.
//!
//! ```bash
//! embedql src/                      # parse every JS/TS file containing graphql
//! embedql --extractor=cpp -j 4 lib/ # C++ hosts, four parser threads
//! embedql --print -v app/           # show literal sources, info-level logging
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return embedql_main(argc, argv);
}
