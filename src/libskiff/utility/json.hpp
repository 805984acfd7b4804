/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_json_hpp
#define libskiff_utility_json_hpp

#include <istream>
#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/schema.h>

/**
 * Utility functions for JSON operations
 */

namespace libskiff {
namespace json {

rapidjson::SchemaDocument readSchema(const boost::filesystem::path& schemaFile);
rapidjson::Document parseStream(std::istream& is);
rapidjson::Document parse(const std::string& string);
rapidjson::Document read(const boost::filesystem::path& filename);
rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile,
                                    const boost::filesystem::path& schemaFile);
std::string serialize(const rapidjson::Value& json);

// Accessors returning an empty string when the member is missing or not a string
std::string getStringMember(const rapidjson::Value& object, const char* name);

}}

#endif
