#include "traversal_error.hpp"

#include <magic_enum.hpp>
#include <sstream>

namespace querywalk {
    namespace {
        auto format_severity(std::ostringstream& oss, bool colored) -> void {
            if (colored) {
                oss << term::RED << term::BOLD << "error: " << term::RESET << term::BOLD;
            } else {
                oss << "error: ";
            }
        }
    }  // namespace

    auto TraversalError::kind_name() const -> std::string_view {
        return magic_enum::enum_name(m_kind);
    }

    auto TraversalError::format(bool colored) const -> std::string {
        auto oss = std::ostringstream {};

        format_severity(oss, colored);
        oss << m_message;
        if (colored) {
            oss << term::RESET;
        }
        if (!m_node.is_null()) {
            oss << "\n  at " << m_node.dump();
        }
        return oss.str();
    }

    auto TraversalError::to_json() const -> Json {
        auto json = Json { { "kind", std::string(kind_name()) }, { "message", m_message } };
        if (!m_node.is_null()) {
            json["node"] = m_node;
        }
        return json;
    }
}  // namespace querywalk
