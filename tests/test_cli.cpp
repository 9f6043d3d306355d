#include <catch2/catch.hpp>

#include "cli/CommandLineInterface.hpp"
#include "cli/ConfigurationManager.hpp"
#include "core/Logger.hpp"
#include "export/STLExporter.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace debris;

namespace {

void write_text(const std::string& path, const std::string& text) {
    std::ofstream file(path);
    file << text;
}

} // namespace

TEST_CASE("No arguments gives the default configuration", "[CLI]") {
    test::LoggerStateGuard guard;
    CommandLineInterface cli;

    REQUIRE(cli.parse_arguments(std::vector<std::string>{}));
    const auto& config = cli.get_config();
    CHECK(config.vertex_count == 10);
    CHECK(config.characteristic_length_mm == 10.0);
    CHECK(config.irregularity == 0.5);
    CHECK_FALSE(config.seed.has_value());
    CHECK(config.max_attempts == 1);
    CHECK(config.export_enabled);
    CHECK(config.output_path == "debris.stl");
    CHECK_FALSE(config.ascii_stl);
    CHECK_FALSE(cli.is_dry_run());
}

TEST_CASE("Generation and output options are parsed", "[CLI]") {
    test::LoggerStateGuard guard;
    CommandLineInterface cli;

    REQUIRE(cli.parse_arguments(std::vector<std::string>{
        "-n", "12", "--length=25.5", "-i", "0.25", "--seed", "42",
        "-o", "out/shard.stl", "--ascii", "--solid-name", "shard",
        "--max-attempts", "3", "--dry-run"}));

    const auto& config = cli.get_config();
    CHECK(config.vertex_count == 12);
    CHECK(config.characteristic_length_mm == 25.5);
    CHECK(config.irregularity == 0.25);
    REQUIRE(config.seed.has_value());
    CHECK(*config.seed == 42);
    CHECK(config.output_path == "out/shard.stl");
    CHECK(config.ascii_stl);
    CHECK(config.solid_name == "shard");
    CHECK(config.max_attempts == 3);
    CHECK(cli.is_dry_run());
}

TEST_CASE("Negative numbers are values, not options", "[CLI]") {
    test::LoggerStateGuard guard;
    CommandLineInterface cli;

    REQUIRE(cli.parse_arguments(std::vector<std::string>{"-i", "-0.1", "--length", "-5"}));
    CHECK(cli.get_config().irregularity == -0.1);
    CHECK(cli.get_config().characteristic_length_mm == -5.0);
}

TEST_CASE("Malformed arguments exit with status 1", "[CLI]") {
    test::LoggerStateGuard guard;

    const std::vector<std::vector<std::string>> bad = {
        {"--vertices", "ten"},
        {"-n", "7.5"},
        {"--seed", "-3"},
        {"--seed", "abc"},
        {"--bogus"},
        {"--length"},
        {"--max-attempts", "0"},
        {"--ascii=yes"},
        {"stray"},
        {"--log-level", "loud"},
    };

    for (const auto& args : bad) {
        CommandLineInterface cli;
        INFO("arguments: " << args.front());
        REQUIRE_FALSE(cli.parse_arguments(args));
        REQUIRE(cli.exit_code() == CommandLineInterface::exit_argument_error);
    }
}

TEST_CASE("Help exits cleanly", "[CLI]") {
    test::LoggerStateGuard guard;
    CommandLineInterface cli;

    REQUIRE_FALSE(cli.parse_arguments(std::vector<std::string>{"--help"}));
    REQUIRE(cli.exit_code() == 0);
}

TEST_CASE("Logging options configure the logger registry", "[CLI]") {
    test::LoggerStateGuard guard;

    SECTION("per-facility levels") {
        CommandLineInterface cli;
        REQUIRE(cli.parse_arguments(std::vector<std::string>{"--log-level", "4,ConvexHullBuilder=6"}));
        CHECK(cli.get_config().log_level == 4);
        CHECK(Logger::getFacilityLevel("ConvexHullBuilder") == LogLevel::TRACE);
    }

    SECTION("a rejected level string leaves the registry alone") {
        Logger::setDefaultLevel(LogLevel::INFO);
        CommandLineInterface cli;
        REQUIRE_FALSE(cli.parse_arguments(std::vector<std::string>{"--log-level", "6,Foo=x"}));
        CHECK(cli.exit_code() == CommandLineInterface::exit_argument_error);
        CHECK(Logger::getDefaultLevel() == LogLevel::INFO);
    }

    SECTION("silent") {
        CommandLineInterface cli;
        REQUIRE(cli.parse_arguments(std::vector<std::string>{"-s", "--log-file", "run.log"}));
        CHECK(cli.get_config().log_level == 0);
        CHECK(Logger::getDefaultLevel() == LogLevel::ERROR);
        CHECK(cli.get_config().log_file == std::optional<std::string>("run.log"));
    }
}

TEST_CASE("Config file values are overridden by the command line", "[CLI][Config]") {
    test::TempDir dir;
    test::LoggerStateGuard guard;
    const std::string path = dir.file("debris.json");
    write_text(path, R"({
  "vertex_count": 15,
  "characteristic_length_mm": 40.0,
  "irregularity": 0.2,
  "seed": 7,
  "output_path": "from_config.stl",
  "ascii_stl": true,
  "solid_name": "configured",
  "max_attempts": 4
})");

    CommandLineInterface cli;
    REQUIRE(cli.parse_arguments(std::vector<std::string>{"-c", path, "-n", "8", "-o", "cli.stl"}));

    const auto& config = cli.get_config();
    CHECK(config.vertex_count == 8);
    CHECK(config.characteristic_length_mm == 40.0);
    CHECK(config.irregularity == 0.2);
    CHECK(config.seed == std::optional<std::uint64_t>(7));
    CHECK(config.output_path == "cli.stl");
    CHECK(config.ascii_stl);
    CHECK(config.solid_name == "configured");
    CHECK(config.max_attempts == 4);
    CHECK(config.config_file == std::optional<std::string>(path));
}

TEST_CASE("Bad config files are rejected", "[CLI][Config]") {
    test::TempDir dir;
    test::LoggerStateGuard guard;

    const std::string malformed = dir.file("malformed.json");
    write_text(malformed, "{ \"vertex_count\": 10, ");
    const std::string wrong_type = dir.file("wrong_type.json");
    write_text(wrong_type, R"({"vertex_count": "ten"})");
    const std::string negative_seed = dir.file("negative_seed.json");
    write_text(negative_seed, R"({"seed": -4})");

    for (const auto& path : {malformed, wrong_type, negative_seed, dir.file("missing.json")}) {
        CommandLineInterface cli;
        INFO(path);
        REQUIRE_FALSE(cli.parse_arguments(std::vector<std::string>{"--config", path}));
        REQUIRE(cli.exit_code() == CommandLineInterface::exit_argument_error);
    }

    ConfigurationManager manager;
    DebrisConfig config;
    config.vertex_count = 11;
    REQUIRE_FALSE(manager.load_from_file(wrong_type, config));
    CHECK(manager.last_error().find("vertex_count") != std::string::npos);
    CHECK(config.vertex_count == 11);
}

TEST_CASE("Default config file round-trips", "[CLI][Config]") {
    test::TempDir dir;
    test::LoggerStateGuard guard;
    const std::string path = dir.file("default.json");

    CommandLineInterface creator;
    REQUIRE_FALSE(creator.parse_arguments(std::vector<std::string>{"--create-config", path}));
    REQUIRE(creator.exit_code() == 0);

    nlohmann::json written = nlohmann::json::parse(test::read_file(path));
    CHECK(written["vertex_count"] == 10);
    CHECK(written["seed"].is_null());

    ConfigurationManager manager;
    DebrisConfig loaded;
    loaded.vertex_count = 17;
    loaded.seed = 3;
    REQUIRE(manager.load_from_file(path, loaded));
    CHECK(loaded.vertex_count == 10);
    CHECK(loaded.characteristic_length_mm == 10.0);
    CHECK_FALSE(loaded.seed.has_value());
    CHECK(loaded.output_path == "debris.stl");
}

TEST_CASE("Integer config keys outside int range are rejected", "[CLI][Config]") {
    test::LoggerStateGuard guard;
    ConfigurationManager manager;

    DebrisConfig config;
    REQUIRE_FALSE(manager.load_from_json(nlohmann::json::parse(R"({"vertex_count": 4294967301})"), config));
    CHECK(manager.last_error().find("vertex_count") != std::string::npos);
    CHECK(config.vertex_count == 10);

    REQUIRE_FALSE(manager.load_from_json(nlohmann::json::parse(R"({"max_attempts": 4294967296})"), config));
    CHECK(manager.last_error().find("max_attempts") != std::string::npos);
    CHECK(config.max_attempts == 1);

    REQUIRE_FALSE(manager.load_from_json(nlohmann::json::parse(R"({"max_attempts": -4294967296})"), config));
    CHECK(config.max_attempts == 1);

    REQUIRE(manager.load_from_json(nlohmann::json::parse(R"({"vertex_count": 12})"), config));
    CHECK(config.vertex_count == 12);
}

TEST_CASE("Degenerate draws are retried on the same engine", "[CLI][Retry]") {
    test::LoggerStateGuard guard;
    DebrisGenerator generator(GenerationParameters{});

    int calls = 0;
    auto first_draw_rejected = [&](RandomEngine& engine) -> MeshHandle {
        ++calls;
        if (calls == 1) {
            engine.discard(7);
            throw DegenerateGeometryError("all 10 points are coplanar");
        }
        return generator.generate(engine);
    };

    RandomEngine rng(42);
    MeshHandle retried = CommandLineInterface::generate_with_retries(first_draw_rejected, rng, 3);
    CHECK(calls == 2);

    // The second attempt continues the stream where the rejected one stopped
    RandomEngine replay(42);
    replay.discard(7);
    MeshHandle expected = generator.generate(replay);
    CHECK(retried.vertices() == expected.vertices());
    CHECK(retried.triangles() == expected.triangles());
    CHECK(retried.achieved_characteristic_length() == expected.achieved_characteristic_length());
}

TEST_CASE("Retries stop after max attempts", "[CLI][Retry]") {
    test::LoggerStateGuard guard;
    RandomEngine rng(1);
    int calls = 0;

    SECTION("degenerate geometry is rethrown") {
        auto always_degenerate = [&](RandomEngine&) -> MeshHandle {
            ++calls;
            throw DegenerateGeometryError("all 5 points are collinear");
        };
        REQUIRE_THROWS_AS(CommandLineInterface::generate_with_retries(always_degenerate, rng, 2),
                          DegenerateGeometryError);
        CHECK(calls == 2);
    }

    SECTION("too few hull points are retried") {
        auto always_short = [&](RandomEngine&) -> MeshHandle {
            ++calls;
            throw InsufficientPointsError(3);
        };
        REQUIRE_THROWS_AS(CommandLineInterface::generate_with_retries(always_short, rng, 4),
                          InsufficientPointsError);
        CHECK(calls == 4);
    }

    SECTION("invalid parameters are not retried") {
        auto invalid = [&](RandomEngine&) -> MeshHandle {
            ++calls;
            throw InvalidParameterError("vertex_count", "[5, 20]", "vertex_count must lie in [5, 20]");
        };
        REQUIRE_THROWS_AS(CommandLineInterface::generate_with_retries(invalid, rng, 5),
                          InvalidParameterError);
        CHECK(calls == 1);
    }
}

TEST_CASE("Failures map to exit statuses", "[CLI][ExitCode]") {
    CHECK(CommandLineInterface::run_guarded([]() -> int { return 0; }) == 0);
    CHECK(CommandLineInterface::run_guarded([]() -> int {
        throw InvalidParameterError("irregularity", "[0, 1]", "irregularity must lie in [0, 1]");
    }) == CommandLineInterface::exit_argument_error);
    CHECK(CommandLineInterface::run_guarded([]() -> int {
        throw DegenerateGeometryError("convex hull encloses no measurable volume");
    }) == CommandLineInterface::exit_generation_error);
    CHECK(CommandLineInterface::run_guarded([]() -> int {
        throw InsufficientPointsError(2);
    }) == CommandLineInterface::exit_generation_error);
    CHECK(CommandLineInterface::run_guarded([]() -> int {
        throw ExportError("Cannot write out.stl");
    }) == CommandLineInterface::exit_export_error);
    CHECK(CommandLineInterface::run_guarded([]() -> int {
        throw NoMeshGeneratedError();
    }) == CommandLineInterface::exit_export_error);
    CHECK(CommandLineInterface::run_guarded([]() -> int {
        throw std::runtime_error("unexpected");
    }) == 1);
}

TEST_CASE("Running the parsed configuration", "[CLI][Run]") {
    test::TempDir dir;
    test::LoggerStateGuard guard;
    const std::string output = dir.file("fragment.stl");

    SECTION("a seeded run writes the STL file") {
        CommandLineInterface cli;
        REQUIRE(cli.parse_arguments(std::vector<std::string>{"-s", "--seed", "7", "-o", output}));
        REQUIRE(cli.run() == 0);
        REQUIRE(std::filesystem::exists(output));

        const std::string first = test::read_file(output);
        REQUIRE(first.size() > STLExporter::binary_header_bytes);
        CHECK((first.size() - STLExporter::binary_header_bytes) % STLExporter::binary_facet_bytes == 0);

        REQUIRE(cli.run() == 0);
        CHECK(test::read_file(output) == first);
    }

    SECTION("--no-export writes nothing") {
        CommandLineInterface cli;
        REQUIRE(cli.parse_arguments(std::vector<std::string>{"-s", "--seed", "7", "--no-export", "-o", output}));
        REQUIRE(cli.run() == 0);
        CHECK_FALSE(std::filesystem::exists(output));
    }

    SECTION("--dry-run writes nothing") {
        CommandLineInterface cli;
        REQUIRE(cli.parse_arguments(std::vector<std::string>{"-s", "--dry-run", "-o", output}));
        REQUIRE(cli.run() == 0);
        CHECK_FALSE(std::filesystem::exists(output));
    }

    SECTION("out-of-range parameters exit with status 1") {
        CommandLineInterface cli;
        REQUIRE(cli.parse_arguments(std::vector<std::string>{"-s", "-n", "3", "-o", output}));
        REQUIRE(cli.run() == CommandLineInterface::exit_argument_error);
        CHECK_FALSE(std::filesystem::exists(output));
    }

    SECTION("an unwritable output path exits with status 3") {
        CommandLineInterface cli;
        REQUIRE(cli.parse_arguments(std::vector<std::string>{"-s", "--seed", "7", "-o", dir.path().string()}));
        REQUIRE(cli.run() == CommandLineInterface::exit_export_error);
    }
}
