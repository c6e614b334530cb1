/**
 * @file test_file_utils.cpp
 * @brief Тесты атомарной записи файлов
 */

#include <doctest/doctest.h>
#include "io/file_utils.hpp"
#include <filesystem>
#include <stdexcept>

using namespace logmerge::io;

TEST_CASE("atomicWrite replaces an existing file and leaves no temp file") {
    namespace fs = std::filesystem;
    auto dir = fs::temp_directory_path() / "logmerge_atomic_write";
    std::error_code ec;
    fs::remove_all(dir, ec);

    auto path = dir / "merge_report.json";
    atomicWrite(path, "first");
    REQUIRE(fs::exists(path));
    CHECK(readTextFile(path) == "first");

    atomicWrite(path, "second version");
    CHECK(readTextFile(path) == "second version");

    auto tmp = path;
    tmp += ".tmp";
    CHECK(!fs::exists(tmp));

    fs::remove_all(dir, ec);
}

TEST_CASE("atomicWrite keeps the previous file when the target cannot be replaced") {
    namespace fs = std::filesystem;
    auto dir = fs::temp_directory_path() / "logmerge_atomic_keep";
    std::error_code ec;
    fs::remove_all(dir, ec);

    // Пустой каталог на месте целевого файла: rename файла поверх него
    // проваливается, и каталог должен остаться нетронутым
    auto target = dir / "merged.las";
    fs::create_directories(target);

    CHECK_THROWS_AS(atomicWrite(target, "data"), std::runtime_error);
    CHECK(fs::is_directory(target));

    auto tmp = target;
    tmp += ".tmp";
    CHECK(!fs::exists(tmp));

    fs::remove_all(dir, ec);
}
