#include "ServiceBackend.h"
#include "../db/PgScheduleStore.h"
#include "../observability/Logging.h"
#include <boost/asio/post.hpp>

void PgServiceBackend::submit(Job job) {
    auto env = env_;
    db_->async_with_connection([env, job = std::move(job)](PGconn*& conn) {
        db::PgScheduleStore store(conn);
        db::PgAssigneeDirectory directory(conn);
        scheduling::SchedulingService svc(store, directory, env->zones, env->holidays.get(), env->limits);
        job(svc);
    });
}

MemoryServiceBackend::MemoryServiceBackend(std::shared_ptr<boost::asio::thread_pool> pool, std::shared_ptr<const ServiceEnv> env)
    : pool_(std::move(pool)), env_(std::move(env)),
      store_(std::make_shared<scheduling::InMemoryStore>()),
      directory_(std::make_shared<scheduling::StaticAssigneeDirectory>()) {
    service_ = std::make_shared<scheduling::SchedulingService>(*store_, *directory_, env_->zones, env_->holidays.get(), env_->limits);
}

void MemoryServiceBackend::submit(Job job) {
    // the service refers to the store and directory; keep them alive with it
    auto svc = service_;
    auto store = store_;
    auto directory = directory_;
    auto env = env_;
    boost::asio::post(*pool_, [svc, store, directory, env, job = std::move(job)]() {
        try {
            job(*svc);
        } catch (const std::exception& e) {
            observability::log_error(std::string("memory backend job exception: ") + e.what());
        }
    });
}
