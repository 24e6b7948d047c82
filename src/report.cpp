/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/report.hpp>

#include <format>
#include <string>
#include <string_view>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace satdeliver {

std::string toJSON(const AnalysisResult &result) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &allocator = doc.GetAllocator();

    rapidjson::Value probabilities(rapidjson::kObjectType);
    for (const auto &[name, probability] : result.probabilities) {
        rapidjson::Value key(name.c_str(), allocator);
        probabilities.AddMember(key, probability, allocator);
    }
    doc.AddMember("probabilities", probabilities, allocator);

    rapidjson::Value diagnostics(rapidjson::kArrayType);
    for (const auto &diagnostic : result.diagnostics) {
        std::string kind(toString(diagnostic.kind));
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("kind", rapidjson::Value(kind.c_str(), allocator), allocator);
        entry.AddMember("subject", rapidjson::Value(diagnostic.subject.c_str(), allocator), allocator);
        entry.AddMember("message", rapidjson::Value(diagnostic.message.c_str(), allocator), allocator);
        diagnostics.PushBack(entry, allocator);
    }
    doc.AddMember("diagnostics", diagnostics, allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

void writeJSON(const AnalysisResult &result, std::ostream &os) {
    os << toJSON(result) << std::endl;
}

void printTable(const AnalysisResult &result, std::ostream &os) {
    constexpr std::string_view rowFormat = "{:<30} {:>12}";
    const std::string sep30(30, '-');
    const std::string sep12(12, '-');

    os << std::format(rowFormat, "Target", "Probability") << std::endl;
    os << std::format(rowFormat, sep30, sep12) << std::endl;
    for (const auto &[name, probability] : result.probabilities) {
        os << std::format(rowFormat, name, std::format("{:.4f}", probability)) << std::endl;
    }

    if (result.diagnostics.empty()) {
        return;
    }

    constexpr std::string_view diagFormat = "{:<20} {:<30} {}";
    const std::string sep20(20, '-');
    os << std::endl;
    os << std::format(diagFormat, "Diagnostic", "Subject", "Message") << std::endl;
    os << std::format(diagFormat, sep20, sep30, sep30) << std::endl;
    for (const auto &diagnostic : result.diagnostics) {
        os << std::format(diagFormat, toString(diagnostic.kind), diagnostic.subject, diagnostic.message) << std::endl;
    }
}

}
