#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Reading and writing assembled systems as packed Cap'n Proto
 *        messages.
 *
 * Only available when built with @c ACEFIT_HAS_CAPNP.
 */

#include <string>

#include "acefit/Assembler.hpp"

namespace acefit::io {

/**
 * @brief Writes a system to a file, replacing any existing content.
 * @param path   Destination file.
 * @param system The assembled system.
 * @return Void.
 * @throws acefit::Error if the file cannot be opened.
 */
void write_linear_system(const std::string &path, const LinearSystem &system);

/**
 * @brief Reads a system written by @c write_linear_system.
 * @param path Source file.
 * @return The system.
 * @throws acefit::Error if the file cannot be opened.
 * @throws acefit::ShapeError if stored lengths disagree with the counts.
 */
LinearSystem read_linear_system(const std::string &path);

} // namespace acefit::io
