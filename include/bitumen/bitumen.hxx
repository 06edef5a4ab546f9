/**
 * @file bitumen.hxx
 * @brief Flat archive format that stores a directory tree as a sequence of
 * self-describing entries.
 */

#pragma once

#include <bitumen/archive-reader.hxx>
#include <bitumen/archive-writer.hxx>
#include <bitumen/crc32.hxx>
#include <bitumen/entry-kind.hxx>
#include <bitumen/errors.hxx>
#include <bitumen/metadata-record.hxx>
#include <bitumen/tree-linearizer.hxx>

/**
 * @namespace bitumen
 * @brief Encoder and decoder for bitumen archives.
 *
 * An archive is a plain concatenation of entries with no index or trailer:
 *
 *   header record | raw path | body (files only) | footer record
 *
 * Both records are 40 bytes, little-endian, carry the same payload and differ
 * only in the header flag and their CRC-32. Directory entries always precede
 * file entries.
 *
 * @code{.cpp}
 * #include <bitumen/bitumen.hxx>
 * #include <boost/iostreams/device/back_inserter.hpp>
 * #include <boost/iostreams/device/array.hpp>
 * #include <boost/iostreams/stream.hpp>
 * #include <iostream>
 * #include <vector>
 *
 * namespace io = boost::iostreams;
 *
 * int main() {
 *   std::vector<char> archive;
 *   {
 *     io::stream<io::back_insert_device<std::vector<char>>> out(archive);
 *     bitumen::recursive_archive(out, "src");
 *   }
 *
 *   io::stream<io::array_source> in(archive.data(), archive.size());
 *   auto summary = bitumen::read_archive(in, [](const auto &entry) {
 *     std::cout << bitumen::describe(entry) << '\n';
 *   });
 *   return summary.clean() ? 0 : 1;
 * }
 * @endcode
 *
 * @note Decoding needs a seekable stream because file bodies are skipped.
 */
