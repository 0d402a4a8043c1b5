/**
 * @file toml_reader.cpp
 * @brief Implementation of TOML parsing utilities
 */

#include "core/toml_reader.hpp"
#include "basics/log.hpp"

#include <sstream>

#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

namespace basics {

toml_reader::toml_reader() : toml_data(nullptr) {}

toml_reader::~toml_reader() { reset(); }

void toml_reader::reset() {
  if (toml_data) {
    delete static_cast<toml::table *>(toml_data);
    toml_data = nullptr;
  }
}

bool toml_reader::parse(const std::string &content,
                        const std::string &source_name) {
  reset();
  try {
    toml_data = new toml::table(toml::parse(content, source_name));
    return true;
  } catch (const toml::parse_error &err) {
    std::stringstream ss;
    ss << "Error parsing TOML " << source_name << ": " << err.description()
       << " at line " << err.source().begin.line;
    logger::print_error(ss.str());
    return false;
  }
}

std::string toml_reader::get_string(const std::string &key,
                                    const std::string &default_value) const {
  if (!toml_data) {
    return default_value;
  }

  auto &table = *static_cast<toml::table *>(toml_data);
  auto value = table.at_path(key);
  if (!value || !value.is_string()) {
    return default_value;
  }
  return value.as_string()->get();
}

int64_t toml_reader::get_int(const std::string &key,
                             int64_t default_value) const {
  if (!toml_data) {
    return default_value;
  }

  auto &table = *static_cast<toml::table *>(toml_data);
  auto value = table.at_path(key);
  if (!value || !value.is_integer()) {
    return default_value;
  }
  return value.as_integer()->get();
}

bool toml_reader::has_key(const std::string &key) const {
  if (!toml_data) {
    return false;
  }

  auto &table = *static_cast<toml::table *>(toml_data);
  return static_cast<bool>(table.at_path(key));
}

} // namespace basics
