//  unicfg
//  Universal Configuration Language evaluator
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the unicfg authors
#pragma once

// Standard library includes
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <string>

namespace unicfg {

  // Reads the text of the file at `path` relative to `base_dir`. An empty
  // optional means the file does not exist.
  using FileReader = std::function< std::optional< std::string >(
    const std::string& path, const std::string& base_dir ) >;

  // Looks up one environment variable. An empty optional means the variable
  // is not set, which is a valid outcome.
  using EnvLookup = std::function< std::optional< std::string >(
    const std::string& name ) >;

  inline std::optional< std::string > read_file_from_disk(
    const std::string& path, const std::string& base_dir )
  {
    std::filesystem::path full( path );
    if ( full.is_relative() ) full = std::filesystem::path( base_dir ) / full;

    std::error_code ec;
    if ( !std::filesystem::is_regular_file(full, ec) ) return std::nullopt;

    std::ifstream in( full, std::ios::in | std::ios::binary );
    if ( !in ) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  inline std::optional< std::string > lookup_process_env(
    const std::string& name )
  {
    const char* value = std::getenv( name.c_str() );
    if ( !value ) return std::nullopt;
    return std::string( value );
  }

  inline std::string current_directory() {
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path( ec );
    return ec ? std::string( "." ) : cwd.string();
  }

  // Per-parser configuration
  struct Options {

    // Default bound on value, parenthesis, reference and include nesting
    static constexpr int DEFAULT_MAX_DEPTH = 64;
    int max_depth = DEFAULT_MAX_DEPTH;

    // Include base directory used by parse( text ). parse_file() replaces it
    // with the directory containing the top-level file.
    std::string base_dir = current_directory();

    FileReader reader = read_file_from_disk;
    EnvLookup env = lookup_process_env;
  };

} // namespace unicfg
