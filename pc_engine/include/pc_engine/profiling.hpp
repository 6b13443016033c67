#pragma once

#include <string_view>

#ifdef PC_ENGINE_PROFILE
#include <chrono>
#include <iostream>

namespace pc_engine {

class ProfileScope {
public:
    explicit ProfileScope(std::string_view name)
        : name_(name), start_(std::chrono::steady_clock::now()) {}
    ~ProfileScope() {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_);
        std::cerr << "[profile] " << name_ << ": " << elapsed.count() << "us\n";
    }

    ProfileScope(const ProfileScope&) = delete;
    ProfileScope& operator=(const ProfileScope&) = delete;

private:
    std::string_view name_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace pc_engine

#define PC_ENGINE_PROFILE_CONCAT_INNER(a, b) a##b
#define PC_ENGINE_PROFILE_CONCAT(a, b) PC_ENGINE_PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) \
    ::pc_engine::ProfileScope PC_ENGINE_PROFILE_CONCAT(profile_scope_, __LINE__)(name)
#define PROFILE_FUNCTION() PROFILE_SCOPE(__func__)
#else
#define PROFILE_SCOPE(name) ((void)0)
#define PROFILE_FUNCTION() ((void)0)
#endif
