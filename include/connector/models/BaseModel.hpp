#pragma once

#include "core/types/Error.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace connector::models {

    /**
     * @brief Shape shared by every JSON body the printer API reads or writes.
     *
     * fromJson() rejects malformed input with core::types::ValidationException;
     * isValid() checks value ranges once the fields are parsed.
     */
    class BaseModel {
    public:
        virtual ~BaseModel() = default;

        virtual nlohmann::json toJson() const = 0;

        virtual void fromJson(const nlohmann::json &json) = 0;

        virtual bool isValid() const = 0;

        virtual std::string getTypeName() const = 0;

        void requireValid(const std::string &reason) const {
            if (!isValid()) {
                throw core::types::ValidationException(reason);
            }
        }
    };

} // namespace connector::models
