#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

#include "behave/behave.h"
#include "behave/catalog/sm.hpp"
#include "behave/expr/value.hpp"

namespace behave::catalog {

inline constexpr size_t k_read_chunk = 4096;

inline int32_t read_document(const std::string & path, expr::value & out) {
  std::FILE * file = std::fopen(path.c_str(), "rb");
  if (file == nullptr) {
    return BEHAVE_ERR_IO;
  }
  std::string text;
  char buffer[k_read_chunk];
  size_t n = 0;
  while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
    text.append(buffer, n);
  }
  const bool read_failed = std::ferror(file) != 0;
  std::fclose(file);
  if (read_failed) {
    return BEHAVE_ERR_IO;
  }
  out = expr::value::parse(text, nullptr, false);
  return out.is_discarded() ? BEHAVE_ERR_PARSE_FAILED : BEHAVE_OK;
}

/**
 * reads a catalog file and runs it through a loader machine.
 *
 * returns the I/O or parse status for unreadable files, otherwise the status
 * the loader wrote.
 */
inline int32_t load_file(const std::string & path, const expr::operator_table & ops,
                         registry::builder & builder, load_report & report) {
  expr::value document;
  const int32_t read_err = read_document(path, document);
  if (read_err != BEHAVE_OK) {
    return read_err;
  }
  int32_t err = BEHAVE_OK;
  action::context ctx{};
  sm machine{ctx};
  const bool handled = machine.process_event(event::load{
    .document = &document,
    .operators = &ops,
    .builder = &builder,
    .report_out = &report,
    .error_out = &err,
  });
  if (!handled && err == BEHAVE_OK) {
    return BEHAVE_ERR_ENGINE_FAULT;
  }
  return err;
}

}  // namespace behave::catalog
