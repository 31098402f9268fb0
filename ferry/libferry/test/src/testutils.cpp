#include "testutils.hpp"

#include <chrono>
#include <fstream>
#include <random>
#include <thread>

#include "defaultconfigvalues.hpp"

namespace testutils
{
ferry::config::Config make_config(std::map<std::string, std::any> values)
{
    MapConfigLoader loader {std::move(values)};
    return ferry::config::Config {
        loader, std::make_unique<ferry::config::DefaultConfigValues>()};
}

std::shared_ptr<const ferry::location::CredentialHandle> make_sas_token(const std::string &token)
{
    return std::make_shared<const ferry::location::CredentialHandle>(
        ferry::location::CredentialHandle::Type::SAS_TOKEN, token);
}

bool wait_for(const std::function<bool()> &predicate, unsigned timeout_ms)
{
    using namespace std::chrono;
    auto start = steady_clock::now();
    while (!predicate() &&
           (timeout_ms == 0 ||
               duration_cast<milliseconds>(steady_clock::now() - start).count() <= timeout_ms))
    {
        std::this_thread::yield();
    }
    return predicate();
}

TemporaryDirectory::TemporaryDirectory()
{
    std::random_device                      rd;
    std::uniform_int_distribution<uint64_t> dist;

    path_ = std::filesystem::temp_directory_path() /
            ("ferry_test_" + std::to_string(dist(rd)));
    std::filesystem::create_directories(path_);
}

TemporaryDirectory::~TemporaryDirectory()
{
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TemporaryDirectory::write_file(
    const std::string &name, const std::string &content) const
{
    auto          file_path = path_ / name;
    std::ofstream fs {file_path, std::ios::out | std::ios::binary | std::ios::trunc};
    fs << content;
    return file_path;
}
}  // namespace testutils
