/**
 * @file    cli_app.hpp
 * @brief   CLI Application
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

namespace cgt::cli {

/**
 * Run the command-line tool
 * @return  Process exit code
 */
int run(int argc, char** argv);

}  // namespace cgt::cli
