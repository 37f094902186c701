#include <doctest/doctest.h>
#include <shkit/platform.hpp>

#include <filesystem>
#include <fstream>
#include <set>

#include <sys/stat.h>

namespace {

// Scratch directory removed at scope exit
class TempTestDir {
public:
    TempTestDir() {
        path = (std::filesystem::temp_directory_path() /
                ("shkit_platform_" + shkit::generate_id())).string();
        std::filesystem::create_directories(path);
    }

    ~TempTestDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string path;
};

unsigned permissions_of(const std::string& path) {
    struct stat st {};
    REQUIRE(stat(path.c_str(), &st) == 0);
    return static_cast<unsigned>(st.st_mode & 0777);
}

} // namespace

TEST_CASE("shkit::write_file") {
    TempTestDir temp_dir;

    SUBCASE("writes content with default permissions") {
        std::string path = temp_dir.path + "/data.txt";
        auto result = shkit::write_file(path, "line one\nline two\n");
        REQUIRE(result.ok);
        CHECK(shkit::read_file(path) == std::optional<std::string>("line one\nline two\n"));
        CHECK(permissions_of(path) == 0644);
        CHECK_FALSE(shkit::is_executable(path));
    }

    SUBCASE("applies the requested mode") {
        std::string path = temp_dir.path + "/tool";
        auto result = shkit::write_file(path, "#! /bin/sh\n", 0700);
        REQUIRE(result.ok);
        CHECK(permissions_of(path) == 0700);
        CHECK(shkit::is_executable(path));
    }

    SUBCASE("replaces an existing file") {
        std::string path = temp_dir.path + "/data.txt";
        REQUIRE(shkit::write_file(path, "old").ok);
        REQUIRE(shkit::write_file(path, "new").ok);
        CHECK(shkit::read_file(path) == std::optional<std::string>("new"));
    }

    SUBCASE("leaves no temp files behind") {
        REQUIRE(shkit::write_file(temp_dir.path + "/data.txt", "x").ok);
        int entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(temp_dir.path)) {
            (void)entry;
            ++entries;
        }
        CHECK(entries == 1);
    }

    SUBCASE("fails when the directory is missing") {
        auto result = shkit::write_file(temp_dir.path + "/missing/data.txt", "x");
        CHECK_FALSE(result.ok);
        CHECK_FALSE(result.error.empty());
    }
}

TEST_CASE("shkit::read_file returns nullopt for missing files") {
    TempTestDir temp_dir;
    CHECK_FALSE(shkit::read_file(temp_dir.path + "/absent").has_value());
}

TEST_CASE("shkit directory helpers") {
    TempTestDir temp_dir;
    std::string nested = temp_dir.path + "/a/b/c";

    CHECK(shkit::create_directories(nested));
    CHECK(shkit::is_directory(nested));
    CHECK(shkit::path_exists(nested));

    CHECK(shkit::remove_directory(temp_dir.path + "/a"));
    CHECK_FALSE(shkit::path_exists(nested));

    // Already gone
    CHECK(shkit::remove_directory(temp_dir.path + "/a"));
}

TEST_CASE("shkit::remove_file") {
    TempTestDir temp_dir;
    std::string path = temp_dir.path + "/file";
    std::ofstream(path) << "content";

    CHECK(shkit::remove_file(path));
    CHECK_FALSE(shkit::path_exists(path));
    CHECK_FALSE(shkit::remove_file(path));
}

TEST_CASE("shkit environment helpers") {
    const std::string name = "SHKIT_PLATFORM_TEST_VAR";
    shkit::unset_env(name);
    CHECK_FALSE(shkit::get_env(name).has_value());

    REQUIRE(shkit::set_env(name, "some value"));
    CHECK(shkit::get_env(name) == std::optional<std::string>("some value"));

    REQUIRE(shkit::unset_env(name));
    CHECK_FALSE(shkit::get_env(name).has_value());
}

TEST_CASE("shkit::generate_id produces distinct hex ids") {
    std::set<std::string> ids;
    for (int i = 0; i < 32; ++i) {
        auto id = shkit::generate_id();
        CHECK(id.size() == 16);
        CHECK(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        ids.insert(id);
    }
    CHECK(ids.size() == 32);
}
