#include <cstdlib>
#include <exception>
#include <limits>
#include <memory>
#include <string>

#include <json/json.h>

#include <log/record.hpp>

#include "request.hpp"


static constexpr Json::LargestInt ADD_MINIMUM = 0;
static constexpr Json::LargestInt ADD_MAXIMUM
    = std::numeric_limits<util::stat::count_t>::max();


/**
 *  @brief JSON Value Description
 *
 *  @param value: value of an unexpected type
 *
 *  @details Names the type of a value, with the value itself for scalars,
 *  the way deserialization errors report it
 *
 *  @return description
 */
static std::string
describe
(
    const Json::Value &value
)
{
    switch (value.type())
    {
    case Json::nullValue:
        return "null";
    case Json::intValue:
        return "integer `" + std::to_string(value.asLargestInt()) + "`";
    case Json::uintValue:
        return "integer `" + std::to_string(value.asLargestUInt()) + "`";
    case Json::realValue:
        return "floating point `" + value.asString() + "`";
    case Json::stringValue:
        return "string \"" + value.asString() + "\"";
    case Json::booleanValue:
        return value.asBool() ? "boolean `true`" : "boolean `false`";
    case Json::arrayValue:
        return "sequence";
    case Json::objectValue:
        return "map";
    }

    return "unknown";
}


// Parser errors span lines; responses are single line
static std::string
single_line
(
    std::string text
)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == ' '))
        text.pop_back();

    for (char &character: text)
    {
        if (character == '\n')
            character = ' ';
    }

    return text;
}


/**
 *  @brief Hotplug Request Deserializer
 *
 *  @param body:    request body text
 *  @param request: structure reference to write to
 *  @param fault:   string reference to write deserialization error to
 *
 *  @details Decodes the add count as an unsigned 8-bit integer. Values
 *  outside [0, 255] and non-integers are rejected naming the offending
 *  value and the expected type.
 *
 *  @return execution status code
 */
hotplug::status_code
hotplug::request::parse
(
    const std::string                  &body,
          hotplug::request::request_t  &request,
          std::string                  &fault
) noexcept
{
    try
    {
        /****************************** PARSE BODY ****************************/

        // One JSON document per body, nothing before or after it
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        builder["allowComments"]   = false;
        builder["failIfExtra"]     = true;
        builder["rejectDupKeys"]   = true;

        const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

        Json::Value root;
        std::string errors;
        if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors))
        {
            fault = hotplug::FAULT_DESERIALIZE + single_line(errors);
            return EXIT_FAILURE;
        }


        /***************************** LOCATE FIELD ***************************/

        if (!root.isObject())
        {
            fault = hotplug::FAULT_DESERIALIZE + std::string("invalid type: ")
                + describe(root) + ", expected struct HotplugConfig";
            return EXIT_FAILURE;
        }
        if (!root.isMember("Vcpu"))
        {
            fault = hotplug::FAULT_DESERIALIZE
                + std::string("missing field `Vcpu`");
            return EXIT_FAILURE;
        }

        const Json::Value &vCPU = root["Vcpu"];
        if (!vCPU.isObject())
        {
            fault = hotplug::FAULT_DESERIALIZE + std::string("invalid type: ")
                + describe(vCPU) + ", expected struct VcpuConfig";
            return EXIT_FAILURE;
        }
        if (!vCPU.isMember("add"))
        {
            fault = hotplug::FAULT_DESERIALIZE
                + std::string("missing field `add`");
            return EXIT_FAILURE;
        }


        /***************************** DECODE VALUE ***************************/

        const Json::Value &add = vCPU["add"];
        if (add.type() == Json::intValue)
        {
            const Json::LargestInt value = add.asLargestInt();
            if (value < ADD_MINIMUM || value > ADD_MAXIMUM)
            {
                fault = hotplug::FAULT_DESERIALIZE
                    + std::string("invalid value: ") + describe(add)
                    + ", expected u8";
                return EXIT_FAILURE;
            }

            request.add = static_cast<util::stat::count_t>(value);
            return EXIT_SUCCESS;
        }
        if (add.type() == Json::uintValue)
        {
            const Json::LargestUInt value = add.asLargestUInt();
            if (value > static_cast<Json::LargestUInt>(ADD_MAXIMUM))
            {
                fault = hotplug::FAULT_DESERIALIZE
                    + std::string("invalid value: ") + describe(add)
                    + ", expected u8";
                return EXIT_FAILURE;
            }

            request.add = static_cast<util::stat::count_t>(value);
            return EXIT_SUCCESS;
        }

        fault = hotplug::FAULT_DESERIALIZE + std::string("invalid type: ")
            + describe(add) + ", expected u8";
        return EXIT_FAILURE;
    }

    catch (const std::exception &exception)
    {
        fault = hotplug::FAULT_DESERIALIZE + std::string(exception.what());
        return EXIT_FAILURE;
    }
}


/**
 *  @brief Hotplug Response Encoder
 *
 *  @param code:   outcome of the call
 *  @param result: structure read on success and partial success
 *  @param reason: error reason, or deserialization fault as produced by
 *                 the deserializer
 *
 *  @details Success carries the new vCPU total; a failed notification is
 *  a partial success carrying a warning; every other error carries a
 *  fault message
 *
 *  @return single line JSON body
 */
std::string
hotplug::request::respond
(
          hotplug::error_code  code,
    const hotplug::result_t   &result,
    const std::string         &reason
) noexcept
{
    try
    {
        Json::Value body(Json::objectValue);
        switch (code)
        {
        case hotplug::error_code::NONE:
        case hotplug::error_code::NOTIFICATION:
            body["vcpu_count"]     = static_cast<Json::UInt64>(result.new_total);
            body["added"]          = static_cast<Json::UInt64>(result.added_count);
            body["guest_notified"] = result.guest_notified;
            if (code == hotplug::error_code::NOTIFICATION)
                body["warning"] = reason;
            break;

        case hotplug::error_code::DESERIALIZATION:
            body["fault_message"] = reason;
            break;

        case hotplug::error_code::VALIDATION:
        case hotplug::error_code::BUSY:
        case hotplug::error_code::RESOURCE:
            body["fault_message"] = hotplug::FAULT_HOTPLUG + reason;
            break;
        }

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";

        return Json::writeString(builder, body);
    }

    catch (const std::exception &exception)
    {
        util::log::record
        (
            std::string("Unable to encode response: ") + exception.what(),
            util::log::type::ERROR
        );

        return "{}";
    }
}
