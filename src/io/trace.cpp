#include <wiggle/trace.hpp>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <stdexcept>

#include <wiggle/detector.hpp>
#include <wiggle/logger.hpp>

namespace wiggle
{

static std::string trim(const std::string& s)
{
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

static std::vector<std::string> split_fields(const std::string& line)
{
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true)
    {
        auto comma = line.find(',', start);
        fields.push_back(trim(line.substr(start, comma - start)));
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return fields;
}

static bool parse_double(const std::string& text, double& out)
{
    if (text.empty())
        return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtod(text.c_str(), &end);
    return errno == 0 && end == text.c_str() + text.size() && std::isfinite(out);
}

static bool parse_entity(const std::string& text, EntityId& out)
{
    if (text.empty() || text[0] == '-')
        return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtoull(text.c_str(), &end, 10);
    return errno == 0 && end == text.c_str() + text.size();
}

std::vector<TraceRecord> read_trace(std::istream& in)
{
    std::vector<TraceRecord> records;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line))
    {
        ++line_no;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#')
            continue;

        auto fields = split_fields(content);
        if (fields.size() != 4)
        {
            throw std::runtime_error("trace line " + std::to_string(line_no)
                                     + ": expected 4 fields (timestamp,entity_id,x,y), got "
                                     + std::to_string(fields.size()));
        }

        TraceRecord rec;
        double x = 0.0;
        double y = 0.0;
        if (!parse_double(fields[0], rec.timestamp))
            throw std::runtime_error("trace line " + std::to_string(line_no)
                                     + ": bad timestamp '" + fields[0] + "'");
        if (!parse_entity(fields[1], rec.entity))
            throw std::runtime_error("trace line " + std::to_string(line_no)
                                     + ": bad entity id '" + fields[1] + "'");
        if (!parse_double(fields[2], x) || !parse_double(fields[3], y))
            throw std::runtime_error("trace line " + std::to_string(line_no)
                                     + ": bad position '" + fields[2] + "," + fields[3] + "'");

        rec.position = Vec2{static_cast<float>(x), static_cast<float>(y)};
        records.push_back(rec);
    }
    return records;
}

std::vector<TraceRecord> load_trace(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("cannot open trace file '" + path + "'");

    auto records = read_trace(file);
    WIGGLE_LOG_DEBUG("trace", "loaded {} records from {}", records.size(), path);
    return records;
}

std::vector<TraceTrigger> replay_trace(std::span<const TraceRecord> trace, WiggleDetector& detector)
{
    std::vector<TraceTrigger> triggers;
    for (const auto& rec : trace)
    {
        if (!detector.is_tracking(rec.entity) && !detector.start_tracking(rec.entity))
            continue;

        if (detector.on_tick(rec.entity, rec.position.x, rec.position.y, rec.timestamp))
            triggers.push_back({rec.entity, rec.timestamp});
    }
    return triggers;
}

}  // namespace wiggle
