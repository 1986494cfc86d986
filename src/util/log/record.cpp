#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#include "record.hpp"


// Serializes records written from the API thread and any helper threads
static std::mutex record_mutex;


/**
 *  @brief Log Record Writer
 *
 *  @param message: text of the record
 *  @param type:    record kind deciding label and stream
 *  @param flush:   whether stream is flushed after writing
 *
 *  @details Records are prefixed with local time and their label
 */
void util::log::record
(
    const std::string     &message,
    const util::log::type  type,
    const bool             flush
) noexcept
{
    const util::clock::time_t time = util::clock::time();

    std::lock_guard<std::mutex> guard(record_mutex);

    std::ostream &stream = util::log::is_error(type) ? std::cerr : std::clog;
    stream << time << util::log::SEPARATOR << util::log::label(type)
        << util::log::SEPARATOR << message << '\n';
    if (flush)
        stream.flush();
}


const char *
util::log::label
(
    const util::log::type type
) noexcept
{
    switch (type)
    {
    case util::log::type::STATUS:
        return "STATUS:";
    case util::log::type::START:
        return "START:";
    case util::log::type::STOP:
        return "STOP:";
    case util::log::type::FLAG:
        return "FLAG:";
    case util::log::type::ERROR:
        return "ERROR:";
    case util::log::type::ABORT:
        return "ABORT:";
    }

    return "UNKNOWN:";
}


/**
 *  @brief Local Time Stamp
 *
 *  @return bracketed local date and time, or a placeholder on failure
 */
util::clock::time_t util::clock::time() noexcept
{
    try
    {
        std::time_t time = std::time(nullptr);
        std::tm     local {};
        if (localtime_r(&time, &local) == nullptr)
            return "[N/A N/A]";

        std::stringstream stream;
        stream << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "]";

        return stream.str();
    }

    catch (const std::exception &exception)
    {
        return "[N/A N/A]";
    }
}
