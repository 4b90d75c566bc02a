//
// Created by the shotport authors on 20/09/25.
//

#ifndef SHOTPORT_FILE_SCANNER_HPP
#define SHOTPORT_FILE_SCANNER_HPP

#include <vector>
#include <filesystem>

struct Settings; // Forward declaration

/**
 * @brief Expands the command-line inputs into the list of files to convert.
 *
 * Files named on the command line are always taken (unless junk or
 * filtered out). Directories contribute their .png/.jpg/.jpeg files,
 * recursively unless --no-recursive; @p skip_dir is never entered.
 * Order follows the command line, then directory order sorted by path.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const Settings& settings,
                    const std::filesystem::path& skip_dir);

/**
 * @brief Default output directory: "ios_output" inside the first input
 * folder, or beside the first input file.
 */
std::filesystem::path default_output_dir(const std::vector<std::filesystem::path>& inputs);

#endif //SHOTPORT_FILE_SCANNER_HPP
