#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <engram/metadata/connection_pool.h>
#include <engram/metadata/memory_session.h>

namespace engram::metadata {

/**
 * @brief Owner of the memory store.
 *
 * Hands out MemorySession objects bound to pooled connections. Reads run on whatever
 * connection is free; transact() wraps a unit of work in BEGIN IMMEDIATE so that it
 * commits completely or not at all.
 */
class MemoryRepository {
public:
    /**
     * @brief Open (or create) the store at @p path and bring its schema up to date
     */
    static Result<std::unique_ptr<MemoryRepository>> create(const std::string& path,
                                                            ConnectionPoolConfig config = {});

    ~MemoryRepository();

    MemoryRepository(const MemoryRepository&) = delete;
    MemoryRepository& operator=(const MemoryRepository&) = delete;

    template <typename Fn> auto read(Fn&& fn) -> std::invoke_result_t<Fn, MemorySession&> {
        using R = std::invoke_result_t<Fn, MemorySession&>;
        return pool_->withConnection([&](Database& db) -> R {
            MemorySession session(db);
            return fn(session);
        });
    }

    template <typename Fn> auto transact(Fn&& fn) -> std::invoke_result_t<Fn, MemorySession&> {
        using R = std::invoke_result_t<Fn, MemorySession&>;
        return pool_->withConnection([&](Database& db) -> R {
            MemorySession session(db);
            std::optional<R> out;
            auto tx = db.transaction([&]() -> Result<void> {
                out.emplace(fn(session));
                if (!*out)
                    return out->error();
                return {};
            });
            if (!tx)
                return tx.error();
            return std::move(*out);
        });
    }

    void shutdown();

private:
    explicit MemoryRepository(std::unique_ptr<ConnectionPool> pool);

    Result<void> migrate();

    std::unique_ptr<ConnectionPool> pool_;
};

} // namespace engram::metadata
