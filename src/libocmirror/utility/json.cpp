/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "json.hpp"

#include <fstream>

#include <boost/format.hpp>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/filesystem.hpp"


namespace libocmirror {
namespace json {

rapidjson::Document parseStream(std::istream& is) {
    auto json = rapidjson::Document{};

    try {
        rapidjson::IStreamWrapper isw(is);
        json.ParseStream(isw);
    }
    catch (const std::exception& e) {
        OCMIRROR_RETHROW_ERROR(e, "Error parsing JSON stream");
    }

    return json;
}

rapidjson::Document read(const boost::filesystem::path& filename) {
    std::ifstream ifs(filename.string());
    if(!ifs) {
        auto message = boost::format("Failed to open JSON file %s") % filename;
        OCMIRROR_THROW_ERROR(message.str());
    }
    auto json = parseStream(ifs);
    if (json.HasParseError()) {
        auto message = boost::format(
            "Error parsing JSON file %s. Input data is not valid JSON\n"
            "Error(offset %u): %s")
            % filename
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        OCMIRROR_THROW_ERROR(message.str());
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
        std::ifstream inputStream(jsonFile.string());
        if(!inputStream) {
            auto message = boost::format("Failed to open JSON file %s") % jsonFile;
            OCMIRROR_THROW_ERROR(message.str());
        }
        rapidjson::IStreamWrapper streamWrapper(inputStream);
        // parse while validating the SAX events against the schema
        rapidjson::SchemaValidatingReader<rapidjson::kParseDefaultFlags, rapidjson::IStreamWrapper, rapidjson::UTF8<> > reader(streamWrapper, schema);
        json.Populate(reader);

        if (!reader.GetParseResult()) {
            // the reader terminates either on schema violations or on I/O/syntax errors
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
                OCMIRROR_THROW_ERROR(message.str());
            }
            else {
                auto message = boost::format("Error parsing JSON file %s: %s")
                    % jsonFile % rapidjson::GetParseError_En(reader.GetParseResult().Code());
                OCMIRROR_THROW_ERROR(message.str());
            }
        }
    }
    catch (const std::exception& e) {
        auto message = boost::format("Error reading JSON file %s") % jsonFile;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }

    return json;
}

void write(const rapidjson::Value& json, const boost::filesystem::path& filename) {
    try {
        filesystem::createFoldersIfNecessary(filename.parent_path());
        std::ofstream ofs(filename.string());
        if(!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            OCMIRROR_THROW_ERROR(message.str());
        }
        rapidjson::OStreamWrapper osw(ofs);
        rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(osw);
        writer.SetIndent(' ', 3);
        json.Accept(writer);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write JSON to %s") % filename;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

std::string serialize(const rapidjson::Value& json) {
    namespace rj = rapidjson;
    rj::StringBuffer buffer;
    rj::Writer<rj::StringBuffer> writer(buffer);
    json.Accept(writer);
    return buffer.GetString();
}

}}
