/// @file cim_query.cpp
/// @brief Single-property CIM reads implementation

#include "cim_query.hpp"

#include "core/util/logger.hpp"

#include "value_format.hpp"
#include "wmi_session.hpp"

namespace verinfo::sysinfo {

std::string cimQuery(CimClass cls, std::string_view property) {
    auto class_name = to_string(cls);

    auto query = buildSelectQuery(cls, property);
    if (!query) {
        auto message = to_string(WmiStage::InvalidProperty);
        LOG_ERROR("{} call failed. {}: \"{}\"", class_name, message, property);
        return std::string(message);
    }

    auto session = WmiSession::connect();
    if (!session) {
        std::string message = session.error().message();
        LOG_ERROR("{} call failed. {}", class_name, message);
        return message;
    }

    auto value = session->queryFirst(*query, property);
    if (!value) {
        std::string message = value.error().message();
        LOG_ERROR("{} call failed. {}", class_name, message);
        return message;
    }

    std::string result = value->value_or(std::string(kNoData));
    LOG_DEBUG("{}: {} = {}", class_name, property, result);
    return result;
}

}  // namespace verinfo::sysinfo
