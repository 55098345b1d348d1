#include "utils.hpp"

#include "errors.hpp"

#include <unistd.h>

#include <climits>
#include <cstdint>
#include <ctime>
#include <regex>

namespace systemctl_mqtt::utils
{

std::string formatPayload(const std::string& payload)
{
    static constexpr char hexDigits[] = "0123456789abcdef";

    std::string out = "b'";
    for (unsigned char c : payload)
    {
        switch (c)
        {
            case '\\':
                out += "\\\\";
                break;
            case '\'':
                out += "\\'";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                if (c >= 0x20 && c < 0x7f)
                {
                    out += static_cast<char>(c);
                }
                else
                {
                    out += "\\x";
                    out += hexDigits[c >> 4];
                    out += hexDigits[c & 0x0f];
                }
        }
    }
    out += '\'';
    return out;
}

std::chrono::milliseconds parseDuration(const std::string& text)
{
    static const std::regex reBlank("\\s*");
    static const std::regex rePlain("\\s*([0-9]+(\\.[0-9]+)?)\\s*");
    static const std::regex reUnits(
        "\\s*([0-9]+(\\.[0-9]+)?\\s*(h|min|m|sec|s)\\s*)+");
    static const std::regex rePart("([0-9]+(?:\\.[0-9]+)?)\\s*(h|min|m|sec|s)");

    // The regex engine recurses per repetition, long input exhausts the stack
    if (text.size() > maxDurationLength)
    {
        throw ActionError("delay too long: " + std::to_string(text.size()) +
                          " characters");
    }

    std::smatch m;
    if (std::regex_match(text, reBlank))
    {
        return std::chrono::milliseconds::zero();
    }

    double seconds = 0;
    if (std::regex_match(text, m, rePlain))
    {
        seconds = std::stod(m[1].str());
    }
    else if (std::regex_match(text, reUnits))
    {
        for (auto it = std::sregex_iterator(text.begin(), text.end(), rePart);
             it != std::sregex_iterator(); ++it)
        {
            const double value = std::stod((*it)[1].str());
            const auto unit = (*it)[2].str();
            if (unit == "h")
            {
                seconds += value * 3600;
            }
            else if (unit == "m" || unit == "min")
            {
                seconds += value * 60;
            }
            else
            {
                seconds += value;
            }
        }
    }
    else
    {
        throw ActionError("invalid delay '" + text + "'");
    }

    const auto maxSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(maxDuration).count();
    if (seconds > static_cast<double>(maxSeconds))
    {
        throw ActionError("delay '" + text + "' exceeds " +
                          std::to_string(maxSeconds) + " seconds");
    }

    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000));
}

std::string formatTime(std::chrono::system_clock::time_point time)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);

    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local) == 0)
    {
        return {};
    }
    return buf;
}

std::string getHostname()
{
    char name[HOST_NAME_MAX + 1] = {};
    if (gethostname(name, sizeof(name) - 1) != 0)
    {
        return {};
    }
    return name;
}

} // namespace systemctl_mqtt::utils
