#ifndef PIIGUARD_DETECTION_REMOTE_ENTITY_SOURCE_HPP
#define PIIGUARD_DETECTION_REMOTE_ENTITY_SOURCE_HPP

#include <curl/curl.h>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "entity_source.hpp"
#include "../util/json.hpp"
#include "../util/utf8.hpp"
#include "../util/logger.hpp"

/**
 * @file remote_entity_source.hpp
 * @brief EntitySource backed by an external NER HTTP service.
 *
 * Wire format:
 *   request : POST <endpoint>, Content-Type: application/json
 *             {"text":"<document>"}
 *   response: {"entities":[{"start":0,"end":8,"label":"PERSON"}, ...]}
 *
 * Offsets in the response are either UTF-8 byte offsets or Unicode code
 * point indices, depending on the service; OffsetUnit says which.
 */

namespace piiguard {
namespace detection {

enum class OffsetUnit {
    Byte,
    CodePoint
};

inline OffsetUnit parseOffsetUnit(const std::string &value)
{
    if (value == "byte") {
        return OffsetUnit::Byte;
    }
    if (value == "codepoint") {
        return OffsetUnit::CodePoint;
    }
    throw core::ConfigurationError("ner.offset_unit must be 'byte' or 'codepoint', got '" + value + "'");
}

struct RemoteEntitySourceOptions
{
    std::string endpoint;
    long timeoutSeconds = 10;
    OffsetUnit offsetUnit = OffsetUnit::Byte;
};

/**
 * @class RemoteEntitySource
 * @brief Posts each document to the NER service and converts the reply to spans.
 */
class RemoteEntitySource : public EntitySource
{
public:
    explicit RemoteEntitySource(RemoteEntitySourceOptions options)
        : options_(std::move(options))
    {
        if (options_.endpoint.empty()) {
            throw core::ModelUnavailableError("RemoteEntitySource: no endpoint configured");
        }
        initCurl();
    }

    std::vector<core::Span> detect(const std::string &text) const override
    {
        const std::string body = "{\"text\":\"" + util::json::escapeString(text) + "\"}";
        std::string response;
        long status = httpPost(body, response);
        if (status < 200 || status >= 300) {
            throw core::InferenceError("RemoteEntitySource: NER service answered HTTP " + std::to_string(status));
        }
        return parseResponse(text, response, options_.offsetUnit);
    }

    std::string name() const override
    {
        return "remote:" + options_.endpoint;
    }

    /**
     * @brief Convert a service reply into byte-offset spans over text.
     *        Only start, end and label are filled in; the engine does the rest.
     * @throw core::InferenceError if the reply is not in the expected shape.
     */
    static std::vector<core::Span> parseResponse(const std::string &text,
                                                 const std::string &response,
                                                 OffsetUnit unit)
    {
        std::vector<std::size_t> table;
        if (unit == OffsetUnit::CodePoint) {
            table = util::utf8::codePointOffsets(text);
        }

        std::vector<core::Span> spans;
        bool sawEntities = false;
        try {
            util::json::Cursor cursor(response);
            cursor.expect('{');
            if (!cursor.consume('}')) {
                do {
                    const std::string key = cursor.readString();
                    cursor.expect(':');
                    if (key != "entities") {
                        cursor.skipValue();
                        continue;
                    }
                    sawEntities = true;
                    cursor.expect('[');
                    if (cursor.consume(']')) {
                        continue;
                    }
                    do {
                        spans.push_back(readEntity(cursor, table, unit));
                    } while (cursor.consume(','));
                    cursor.expect(']');
                } while (cursor.consume(','));
                cursor.expect('}');
            }
            if (!cursor.atEnd()) {
                throw std::runtime_error("trailing data after the reply object");
            }
        } catch (const core::InferenceError &) {
            throw;
        } catch (const std::exception &ex) {
            throw core::InferenceError(std::string("RemoteEntitySource: malformed reply: ") + ex.what());
        }

        if (!sawEntities) {
            throw core::InferenceError("RemoteEntitySource: reply has no \"entities\" array");
        }
        return spans;
    }

private:
    static void initCurl()
    {
        static std::once_flag flag;
        std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    /// One {"start":..,"end":..,"label":..} object; other members are skipped.
    static core::Span readEntity(util::json::Cursor &cursor,
                                 const std::vector<std::size_t> &table,
                                 OffsetUnit unit)
    {
        bool hasStart = false;
        bool hasEnd = false;
        bool hasLabel = false;
        uint64_t start = 0;
        uint64_t end = 0;
        core::Span span;
        span.source = core::SpanSource::Model;

        cursor.expect('{');
        if (!cursor.consume('}')) {
            do {
                const std::string key = cursor.readString();
                cursor.expect(':');
                if (key == "start") {
                    start = cursor.readUnsigned();
                    hasStart = true;
                } else if (key == "end") {
                    end = cursor.readUnsigned();
                    hasEnd = true;
                } else if (key == "label") {
                    span.label = cursor.readString();
                    hasLabel = true;
                } else {
                    cursor.skipValue();
                }
            } while (cursor.consume(','));
            cursor.expect('}');
        }
        if (!hasStart || !hasEnd || !hasLabel) {
            throw core::InferenceError("RemoteEntitySource: entity without start/end/label");
        }

        if (unit == OffsetUnit::CodePoint) {
            try {
                span.start = util::utf8::toByteOffset(table, static_cast<std::size_t>(start));
                span.end = util::utf8::toByteOffset(table, static_cast<std::size_t>(end));
            } catch (const std::out_of_range &ex) {
                throw core::InferenceError(std::string("RemoteEntitySource: bad entity offset: ") + ex.what());
            }
        } else {
            span.start = static_cast<std::size_t>(start);
            span.end = static_cast<std::size_t>(end);
        }
        return span;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata)
    {
        if (!userdata)
            return 0;
        std::string* resp = reinterpret_cast<std::string*>(userdata);
        size_t total = size * nmemb;
        resp->append(ptr, total);
        return total;
    }

    /**
     * @return The HTTP status code.
     * @throw core::ModelUnavailableError on any transport failure.
     */
    long httpPost(const std::string &body, std::string &responseOut) const
    {
        CURL* curl = curl_easy_init();
        if (!curl) {
            throw core::ModelUnavailableError("RemoteEntitySource: curl_easy_init failed");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_URL, options_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseOut);

        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        }
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            throw core::ModelUnavailableError(std::string("RemoteEntitySource: ") + curl_easy_strerror(res));
        }
        return status;
    }

    RemoteEntitySourceOptions options_;
};

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_REMOTE_ENTITY_SOURCE_HPP
