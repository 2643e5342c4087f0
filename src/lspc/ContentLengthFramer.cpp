//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length based framer for the LSP base protocol
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "lspc/ContentFramer.h"

namespace lspc {

namespace {
class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            if (buffer.size() > MaxHeaderSectionSize) {
                LOG_WARN("No header terminator within {} bytes; discarding {} bytes", MaxHeaderSectionSize, buffer.size());
                return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos <= headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                break;
            }
            std::string line = buffer.substr(pos, eol - pos);
            pos = eol + 2;
            auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            name.erase(std::find_if(name.rbegin(), name.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), name.end());
            if (name != "content-length") {
                continue; // Content-Type and unknown headers are ignored
            }
            std::string value = line.substr(colon + 1);
            value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
            value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
            const bool allDigits = !value.empty() &&
                std::all_of(value.begin(), value.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
            if (!allDigits) {
                LOG_WARN("Invalid Content-Length header: {}", value);
                return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
            }
            try {
                unsigned long long v64 = std::stoull(value);
                if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max()) {
                    LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                }
                contentLength = static_cast<std::size_t>(v64);
                haveLength = true;
            } catch (const std::out_of_range&) {
                LOG_WARN("Content-Length {} exceeds limits (max={})", value, maxContentLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
            }
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        if (contentLength > std::numeric_limits<std::size_t>::max() - headerAndSep) {
            LOG_WARN("Frame size overflow detected (header={}, len={})", headerAndSep, contentLength);
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }
        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

private:
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace lspc
