#pragma once

#include "common.hpp"

namespace querywalk {
    // Position of a node inside the query text it was parsed from.
    class SourceSpan {
    public:
        SourceSpan() = default;
        SourceSpan(uint32_t offset, uint32_t length) : m_offset(offset), m_length(length) {}

        [[nodiscard]] auto offset() const -> uint32_t {
            return m_offset;
        }
        [[nodiscard]] auto length() const -> uint32_t {
            return m_length;
        }
        [[nodiscard]] auto end() const -> uint32_t {
            return m_offset + m_length;
        }

        [[nodiscard]] auto to_json() const -> Json {
            return { { "offset", m_offset }, { "length", m_length } };
        }

        auto operator==(const SourceSpan&) const -> bool = default;

    private:
        uint32_t m_offset {};
        uint32_t m_length {};
    };

    // Whitespace around a node in the query text, kept so a rewritten tree
    // prints back with the original layout.
    struct Decoration {
        Option<SourceSpan> span;
        std::string head;
        std::string tail;

        [[nodiscard]] auto to_json() const -> Json {
            auto json = Json::object();
            if (span) {
                json["span"] = span->to_json();
            }
            if (!head.empty()) {
                json["head"] = head;
            }
            if (!tail.empty()) {
                json["tail"] = tail;
            }
            return json;
        }
    };
}  // namespace querywalk
