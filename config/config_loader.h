#pragma once

#include <string>
#include <string_view>

#include "audit_config.h"

namespace UiAudit {

/// JSON overlay on top of an AuditConfig.
///
/// Every key is optional; a present array replaces the default list rather
/// than extending it. Unknown keys are ignored; type mismatches and unknown
/// enum values are configuration errors.
class ConfigLoader {
public:
    /// Read and apply a JSON file
    [[nodiscard]] static auto loadFile(const char* path, AuditConfig* config, std::string* error) noexcept -> bool;

    /// Apply an in-memory JSON document
    [[nodiscard]] static auto loadString(std::string_view json, AuditConfig* config, std::string* error) noexcept -> bool;

    ConfigLoader() = delete;
};

} // namespace UiAudit
