#pragma once

#include "../db/DbPool.h"
#include "../scheduling/AssigneeDirectory.h"
#include "../scheduling/InMemoryStore.h"
#include "../scheduling/SchedulingService.h"
#include <boost/asio/thread_pool.hpp>
#include <functional>
#include <memory>

// Settings shared by every service instance a backend creates.
struct ServiceEnv {
    scheduling::TenantTimeZones zones;
    std::shared_ptr<const recurrence::HolidayCalendar> holidays;
    scheduling::ServiceLimits limits;
};

// Runs scheduling work off the io thread. The job receives a service bound to the
// backend's store and must not throw.
class ServiceBackend {
public:
    using Job = std::function<void(scheduling::SchedulingService&)>;
    virtual ~ServiceBackend() = default;
    virtual void submit(Job job) = 0;
    virtual const char* name() const = 0;
};

// One libpq connection per DbPool worker; each job gets a store over that connection.
class PgServiceBackend : public ServiceBackend {
public:
    PgServiceBackend(std::shared_ptr<db::DbPool> db, std::shared_ptr<const ServiceEnv> env)
        : db_(std::move(db)), env_(std::move(env)) {}
    void submit(Job job) override;
    const char* name() const override { return "postgres"; }
private:
    std::shared_ptr<db::DbPool> db_;
    std::shared_ptr<const ServiceEnv> env_;
};

// Process-local store on the CPU pool.
class MemoryServiceBackend : public ServiceBackend {
public:
    MemoryServiceBackend(std::shared_ptr<boost::asio::thread_pool> pool, std::shared_ptr<const ServiceEnv> env);
    void submit(Job job) override;
    const char* name() const override { return "memory"; }
private:
    std::shared_ptr<boost::asio::thread_pool> pool_;
    std::shared_ptr<const ServiceEnv> env_;
    std::shared_ptr<scheduling::InMemoryStore> store_;
    std::shared_ptr<scheduling::StaticAssigneeDirectory> directory_;
    std::shared_ptr<scheduling::SchedulingService> service_;
};
