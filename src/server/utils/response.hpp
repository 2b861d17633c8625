/*
 * response.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_SERVER_UTILS_RESPONSE_HPP
#define RUNWAY_SERVER_UTILS_RESPONSE_HPP

#include <crow.h>
#include <nlohmann/json.hpp>

#include <string>

namespace runway::server::utils {

/**
 * @brief Utility class for creating standardized API responses
 */
class ResponseBuilder {
public:
    /**
     * @brief Serialize a JSON body as-is
     *
     * Invalid UTF-8 in string values is replaced rather than rejected.
     */
    static crow::response json(const nlohmann::json& body, int code = 200) {
        crow::response res(code);
        res.set_header("Content-Type", "application/json");
        res.write(body.dump(-1, ' ', false,
                            nlohmann::json::error_handler_t::replace));
        return res;
    }

    /**
     * @brief Create an error response
     */
    static crow::response error(const std::string& code,
                                const std::string& message,
                                int httpCode = 400,
                                const nlohmann::json& details = nullptr) {
        nlohmann::json errorObj = {{"code", code}, {"message", message}};
        if (!details.is_null()) {
            errorObj["details"] = details;
        }

        nlohmann::json body = {{"status", "error"}, {"error", errorObj}};
        return json(body, httpCode);
    }

    /**
     * @brief Missing required field error (400)
     */
    static crow::response missingField(const std::string& fieldName,
                                       const std::string& requirement = "") {
        nlohmann::json details = {{"field", fieldName}};
        if (!requirement.empty()) {
            details["requirement"] = requirement;
        }
        return error("missing_required_field",
                     "Required field '" + fieldName + "' is missing.", 400,
                     details);
    }

    /**
     * @brief Invalid field value error (400)
     */
    static crow::response invalidFieldValue(const std::string& fieldName,
                                            const std::string& constraint = "") {
        nlohmann::json details = {{"field", fieldName}};
        if (!constraint.empty()) {
            details["constraint"] = constraint;
        }
        return error("invalid_field_value",
                     "Field '" + fieldName + "' has an invalid value.", 400,
                     details);
    }

    /**
     * @brief Invalid JSON error (400)
     */
    static crow::response invalidJson(const std::string& parseError) {
        return error("invalid_json",
                     "The request body is not valid JSON: " + parseError, 400);
    }
};

}  // namespace runway::server::utils

#endif  // RUNWAY_SERVER_UTILS_RESPONSE_HPP
