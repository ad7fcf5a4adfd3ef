// Replays a recorded CSV trace (timestamp,entity_id,x,y) through the detector
// and prints every trigger.
//
//   trace_replay <trace.csv> [low|medium|high] [--multi] [--window <seconds>]

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <wiggle/wiggle.hpp>

using namespace wiggle;

static int usage(const char* argv0)
{
    std::cerr << "usage: " << argv0
              << " <trace.csv> [low|medium|high] [--multi] [--window <seconds>]\n";
    return 2;
}

int main(int argc, char** argv)
{
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().configure_from_env();

    if (argc < 2)
        return usage(argv[0]);

    std::string path = argv[1];
    Sensitivity sensitivity = Sensitivity::Medium;
    DetectorOptions options;
    Thresholds base;

    for (int i = 2; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--multi")
        {
            options.multi_entity = true;
        }
        else if (arg == "--window" && i + 1 < argc)
        {
            base.time_window = std::atof(argv[++i]);
        }
        else if (auto s = sensitivity_from_string(arg))
        {
            sensitivity = *s;
        }
        else
        {
            std::cerr << "unknown argument '" << arg << "'\n";
            return usage(argv[0]);
        }
    }

    try
    {
        auto records = load_trace(path);
        WiggleDetector detector(thresholds_for(sensitivity, base), options);
        auto triggers = replay_trace(records, detector);

        std::cout << records.size() << " samples, sensitivity " << to_string(sensitivity) << ", "
                  << triggers.size() << " trigger(s)\n";
        for (const auto& t : triggers)
            std::cout << "  t=" << t.timestamp << "  entity " << t.entity << "\n";
    }
    catch (const std::exception& e)
    {
        WIGGLE_LOG_ERROR("replay", "{}", e.what());
        return 1;
    }
    return 0;
}
