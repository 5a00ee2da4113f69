#include "object_store.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string to_string(StorageClass c) {
    switch (c) {
        case StorageClass::Standard:    return "STANDARD";
        case StorageClass::StandardIA:  return "STANDARD_IA";
        case StorageClass::GlacierIR:   return "GLACIER_IR";
        case StorageClass::Glacier:     return "GLACIER";
        case StorageClass::DeepArchive: return "DEEP_ARCHIVE";
    }
    return "STANDARD";
}

bool parse_storage_class(const std::string& s, StorageClass& out) {
    std::string u = upper(s);
    if (u == "STANDARD")     { out = StorageClass::Standard;    return true; }
    if (u == "STANDARD_IA")  { out = StorageClass::StandardIA;  return true; }
    if (u == "GLACIER_IR")   { out = StorageClass::GlacierIR;   return true; }
    if (u == "GLACIER")      { out = StorageClass::Glacier;     return true; }
    if (u == "DEEP_ARCHIVE") { out = StorageClass::DeepArchive; return true; }
    return false;
}

bool requires_restore(StorageClass c) {
    return c == StorageClass::Glacier || c == StorageClass::DeepArchive;
}

std::string to_string(RestoreTier t) {
    switch (t) {
        case RestoreTier::Bulk:      return "Bulk";
        case RestoreTier::Standard:  return "Standard";
        case RestoreTier::Expedited: return "Expedited";
    }
    return "Bulk";
}

bool parse_restore_tier(const std::string& s, RestoreTier& out) {
    std::string u = upper(s);
    if (u == "BULK")      { out = RestoreTier::Bulk;      return true; }
    if (u == "STANDARD")  { out = RestoreTier::Standard;  return true; }
    if (u == "EXPEDITED") { out = RestoreTier::Expedited; return true; }
    return false;
}

std::string to_string(RestoreStatus s) {
    switch (s) {
        case RestoreStatus::None:     return "none";
        case RestoreStatus::Ongoing:  return "ongoing";
        case RestoreStatus::Restored: return "restored";
    }
    return "none";
}

std::string StoreError::describe() const {
    const char* kind_name = "service";
    switch (kind) {
        case StoreFailure::Network:      kind_name = "network"; break;
        case StoreFailure::Timeout:      kind_name = "timeout"; break;
        case StoreFailure::Service:      kind_name = "service"; break;
        case StoreFailure::Construction: kind_name = "construction"; break;
    }
    if (kind == StoreFailure::Service) {
        return fmt::format("{} error {} {}: {}", kind_name, http_status,
                           code.empty() ? "-" : code, message);
    }
    return fmt::format("{} error: {}", kind_name, message);
}
