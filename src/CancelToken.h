// CancelToken.h
//
// Cooperative cancellation flag shared between the caller that requests
// cancellation and the operation that polls it at its suspension points
// (between chunks, between reads). Copies share the same flag.

#pragma once

#include <atomic>
#include <memory>

class CancelToken
{
public:
    CancelToken() : m_flag(std::make_shared<std::atomic_bool>(false)) {}

    void cancel() const { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic_bool> m_flag;
};
