#pragma once

// ============================================================================
// MDA - multi-dimensional scan files recorded by the saveData record
// ============================================================================
//
//   auto log = mdaio::logger_t{std::cerr};
//   auto reader = mdaio::mda::reader_t{log};
//   auto file = reader.read_file("scan_0001.mda");
//
//   for (const auto& det : file.scan.detectors) {
//       std::cout << det.field_name << " " << det.name << "\n";
//   }
//
//   mdaio::mda::writer_t{log}.write_file("copy.mda", file);
//
// ============================================================================

#include "mda/format.hpp"
#include "mda/types.hpp"
#include "mda/reader.hpp"
#include "mda/writer.hpp"
