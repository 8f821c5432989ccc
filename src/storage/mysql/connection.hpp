#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>

namespace meetcoord {
namespace storage {

// 单个 MySQL 连接, 析构时关闭
class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    MYSQL* Raw() const noexcept { return handle_; }
    const Options& GetOptions() const noexcept { return options_; }

    // 连接是否仍然可用
    bool Ping() const;

private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

} // namespace storage
} // namespace meetcoord
