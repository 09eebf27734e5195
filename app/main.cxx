#include <cxxgate.hxx>

namespace {
    std::optional<boost::filesystem::path> config_path(std::int32_t argc, char** argv) {
        for (std::int32_t i = 1; i < argc; i++) {
            const std::string_view arg = argv[i];

            if ((arg == "-c" || arg == "--config") && i + 1 < argc)
                return boost::filesystem::path(argv[i + 1]);

            if (arg.starts_with("--config="))
                return boost::filesystem::path(std::string(arg.substr(9u)));
        }

        if (auto from_env = cxxgate::config::process_env("CXXGATE_CONFIG"); from_env.has_value())
            return boost::filesystem::path(*from_env);

        if (const boost::filesystem::path fallback{"config/gateway.json"}; boost::filesystem::exists(fallback))
            return fallback;

        return std::nullopt;
    }
}

std::int32_t main(std::int32_t argc, char** argv) {
    try {
        auto cfg = cxxgate::config::load(config_path(argc, argv));

        cxxgate::gateway::c_gateway gateway(std::move(cfg));

        gateway.start();

        gateway.wait();
    }
    catch (const cxxgate::base_exception_t& e) {
        std::cerr << fmt::format("cxxgate: {}", e.what()) << "\n";

        return EXIT_FAILURE;
    }
    catch (const std::exception& e) {
        std::cerr << fmt::format("cxxgate: unexpected error: {}", e.what()) << "\n";

        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
