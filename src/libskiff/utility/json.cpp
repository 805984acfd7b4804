/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "json.hpp"

#include <fstream>
#include <sstream>

#include <boost/format.hpp>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>

#include "libskiff/Error.hpp"

/**
 * Utility functions for JSON operations
 */

namespace libskiff {
namespace json {

rapidjson::Document parseStream(std::istream& is) {
    auto json = rapidjson::Document{};

    try {
        rapidjson::IStreamWrapper isw(is);
        json.ParseStream(isw);
    }
    catch (const std::exception& e) {
        SKIFF_RETHROW_ERROR(e, "Error parsing JSON stream");
    }

    return json;
}

rapidjson::Document parse(const std::string& string) {
    auto json = rapidjson::Document{};
    json.Parse(string.c_str(), string.size());
    if (json.HasParseError()) {
        auto message = boost::format(
            "Error parsing JSON string:\n'%s'\nInput data is not valid JSON\n"
            "Error(offset %u): %s")
            % string
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        SKIFF_THROW_ERROR(message.str());
    }
    return json;
}

rapidjson::Document read(const boost::filesystem::path& filename) {
    std::ifstream ifs(filename.string());
    if(!ifs) {
        auto message = boost::format("Failed to open JSON file %s") % filename;
        SKIFF_THROW_ERROR(message.str());
    }
    auto json = parseStream(ifs);
    if (json.HasParseError()) {
        auto message = boost::format(
            "Error parsing JSON file %s. Input data is not valid JSON\n"
            "Error(offset %u): %s")
            % filename
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        SKIFF_THROW_ERROR(message.str());
    }
    return json;
}

rapidjson::SchemaDocument readSchema(const boost::filesystem::path& schemaFile) {
    auto schemaJSON = json::read(schemaFile);
    return rapidjson::SchemaDocument{ schemaJSON };
}

rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile, const boost::filesystem::path& schemaFile) {
    auto schema = readSchema(schemaFile);

    rapidjson::Document json;

    try {
        std::ifstream configInputStream(jsonFile.string());
        if(!configInputStream) {
            auto message = boost::format("Failed to open JSON file %s") % jsonFile;
            SKIFF_THROW_ERROR(message.str());
        }
        rapidjson::IStreamWrapper configStreamWrapper(configInputStream);
        // Parse JSON from reader, validate the SAX events, and populate the Document.
        rapidjson::SchemaValidatingReader<rapidjson::kParseDefaultFlags, rapidjson::IStreamWrapper, rapidjson::UTF8<> >
            reader(configStreamWrapper, schema);
        json.Populate(reader);

        if (!reader.GetParseResult()) {
            // When reader.GetParseResult().Code() == kParseErrorTermination,
            // either the document violates the schema or the stream had an I/O error.
            if (!reader.IsValid()) {
                rapidjson::StringBuffer sb;
                reader.GetInvalidSchemaPointer().StringifyUriFragment(sb);
                auto message = boost::format("Invalid schema: %s\n") % sb.GetString();
                message = boost::format("%sInvalid keyword: %s\n") % message % reader.GetInvalidSchemaKeyword();
                sb.Clear();
                reader.GetInvalidDocumentPointer().StringifyUriFragment(sb);
                message = boost::format("%sInvalid document: %s\n") % message % sb.GetString();
                sb.Clear();
                rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
                reader.GetError().Accept(w);
                message = boost::format("%sError report:\n%s") % message % sb.GetString();
                SKIFF_THROW_ERROR(message.str());
            }
            else {
                auto message = boost::format("Error parsing JSON file: %s") % jsonFile;
                SKIFF_THROW_ERROR(message.str());
            }
        }
    }
    catch(const libskiff::Error&) {
        throw;
    }
    catch (const std::exception& e) {
        auto message = boost::format("Error reading JSON file %s") % jsonFile;
        SKIFF_RETHROW_ERROR(e, message.str());
    }

    return json;
}

std::string serialize(const rapidjson::Value& json) {
    namespace rj = rapidjson;
    rj::StringBuffer buffer;
    rj::Writer<rj::StringBuffer> writer(buffer);
    json.Accept(writer);
    return buffer.GetString();
}

std::string getStringMember(const rapidjson::Value& object, const char* name) {
    if(!object.IsObject()) {
        return std::string{};
    }
    auto it = object.FindMember(name);
    if(it == object.MemberEnd() || !it->value.IsString()) {
        return std::string{};
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

}}
