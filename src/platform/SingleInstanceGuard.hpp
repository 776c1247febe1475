#pragma once

#include <memory>

// Held for the lifetime of the app so two instances never write archives
// into the same destination at once
class SingleInstanceGuard
{
public:
    // nullptr when another instance already runs
    static std::unique_ptr<SingleInstanceGuard> Acquire();
    ~SingleInstanceGuard();

    SingleInstanceGuard(const SingleInstanceGuard&) = delete;
    SingleInstanceGuard& operator=(const SingleInstanceGuard&) = delete;

private:
    SingleInstanceGuard() = default;

#ifdef _WIN32
    explicit SingleInstanceGuard(void* handle);
    void* mutex_handle_ = nullptr;
#endif
};
