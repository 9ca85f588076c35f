/**
 * @file PayloadEncoder.hpp
 * @brief Interface for the text -> URL-safe token transform.
 */

#pragma once

#include <string>

namespace zlinker::domain {

/**
 * @class PayloadEncoder
 * @brief Deterministic encoder whose output is embedded as a query parameter.
 *
 * The output must not need further URL escaping. Decoding is the target
 * application's business.
 */
class PayloadEncoder {
public:
    virtual ~PayloadEncoder() = default;

    virtual std::string encode(const std::string& text) const = 0;
};

} // namespace zlinker::domain
