/**
 * DownloadEngine.cpp
 *
 * Each operation is posted to the namespace executor, where it runs with
 * the namespace mutex held.
 */

#include "DownloadEngine.hpp"
#include "NamespaceContext.hpp"
#include "../core/EngineException.hpp"
#include "../core/Logger.hpp"

namespace downlink::engine {

using core::EngineException;
using core::ErrorCode;
using models::CompletedDownload;
using models::Download;
using models::DownloadBlock;
using models::Request;
using models::Status;

namespace {

std::atomic<uint64_t> g_nextInstanceId{1};

} // namespace

DownloadEngine::DownloadEngine(const EngineConfiguration& configuration)
    : m_nameSpace(configuration.nameSpace)
    , m_instanceId(g_nextInstanceId++) {

    core::Logger::instance().setEnabled(configuration.loggingEnabled);
    m_context = NamespaceContext::acquire(configuration);

    LOG_DEBUG("Engine instance {} opened on namespace {}", m_instanceId, m_nameSpace);
}

DownloadEngine::~DownloadEngine() {
    close();
}

template<typename F>
auto DownloadEngine::run(F&& fn)
    -> std::future<std::invoke_result_t<std::decay_t<F>&, NamespaceContext&>> {
    using ReturnType = std::invoke_result_t<std::decay_t<F>&, NamespaceContext&>;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_context) {
        return closedFuture<ReturnType>();
    }

    // The context outlives every task posted to its executor
    NamespaceContext* ctx = m_context.get();
    try {
        return m_context->post([ctx, fn = std::forward<F>(fn)]() mutable { return fn(*ctx); });
    } catch (const std::runtime_error& e) {
        // Executor already stopped
        LOG_DEBUG("Operation rejected on namespace {}: {}", m_nameSpace, e.what());
        return closedFuture<ReturnType>();
    }
}

template<typename T>
std::future<T> DownloadEngine::closedFuture() const {
    std::promise<T> promise;
    promise.set_exception(std::make_exception_ptr(
        EngineException(ErrorCode::EngineClosed, "engine on namespace " + m_nameSpace + " is closed")));
    return promise.get_future();
}

OptionalDownload DownloadEngine::first(const DownloadList& downloads) {
    if (downloads.empty()) {
        return std::nullopt;
    }
    return downloads.front();
}

// -- Intake --

std::future<Request> DownloadEngine::enqueue(const Request& request) {
    return run([request](NamespaceContext& ctx) { return ctx.controlPlane().enqueue(request); });
}

std::future<std::vector<Request>> DownloadEngine::enqueue(const std::vector<Request>& requests) {
    return run([requests](NamespaceContext& ctx) { return ctx.controlPlane().enqueue(requests); });
}

std::future<OptionalDownload> DownloadEngine::updateRequest(int id, const Request& request) {
    return run([id, request](NamespaceContext& ctx) { return ctx.controlPlane().updateRequest(id, request); });
}

std::future<Download> DownloadEngine::addCompletedDownload(const CompletedDownload& completed) {
    return run([completed](NamespaceContext& ctx) { return ctx.controlPlane().addCompletedDownload(completed); });
}

std::future<DownloadList> DownloadEngine::addCompletedDownloads(const std::vector<CompletedDownload>& completed) {
    return run([completed](NamespaceContext& ctx) { return ctx.controlPlane().addCompletedDownloads(completed); });
}

// -- Pause / resume / freeze --

std::future<DownloadList> DownloadEngine::pause(const std::vector<int>& ids) {
    return run([ids](NamespaceContext& ctx) { return ctx.controlPlane().pause(ids); });
}

std::future<OptionalDownload> DownloadEngine::pause(int id) {
    return run([id](NamespaceContext& ctx) { return first(ctx.controlPlane().pause({id})); });
}

std::future<DownloadList> DownloadEngine::pauseGroup(int groupId) {
    return run([groupId](NamespaceContext& ctx) {
        return ctx.controlPlane().pause(ControlPlane::idsOf(ctx.catalog().getByGroup(groupId)));
    });
}

std::future<DownloadList> DownloadEngine::resume(const std::vector<int>& ids) {
    return run([ids](NamespaceContext& ctx) { return ctx.controlPlane().resume(ids); });
}

std::future<OptionalDownload> DownloadEngine::resume(int id) {
    return run([id](NamespaceContext& ctx) { return first(ctx.controlPlane().resume({id})); });
}

std::future<DownloadList> DownloadEngine::resumeGroup(int groupId) {
    return run([groupId](NamespaceContext& ctx) {
        return ctx.controlPlane().resume(ControlPlane::idsOf(ctx.catalog().getByGroup(groupId)));
    });
}

std::future<bool> DownloadEngine::freeze() {
    return run([](NamespaceContext& ctx) { return ctx.controlPlane().freeze(); });
}

std::future<bool> DownloadEngine::unfreeze() {
    return run([](NamespaceContext& ctx) { return ctx.controlPlane().unfreeze(); });
}

// -- Remove --

std::future<DownloadList> DownloadEngine::remove(const std::vector<int>& ids) {
    return run([ids](NamespaceContext& ctx) { return ctx.controlPlane().remove(ids); });
}

std::future<OptionalDownload> DownloadEngine::remove(int id) {
    return run([id](NamespaceContext& ctx) { return first(ctx.controlPlane().remove({id})); });
}

std::future<DownloadList> DownloadEngine::removeGroup(int groupId) {
    return run([groupId](NamespaceContext& ctx) {
        return ctx.controlPlane().remove(ControlPlane::idsOf(ctx.catalog().getByGroup(groupId)));
    });
}

std::future<DownloadList> DownloadEngine::removeAll() {
    return run([](NamespaceContext& ctx) {
        return ctx.controlPlane().remove(ControlPlane::idsOf(ctx.catalog().getAll()));
    });
}

std::future<DownloadList> DownloadEngine::removeAllWithStatus(Status status) {
    return run([status](NamespaceContext& ctx) {
        return ctx.controlPlane().remove(ControlPlane::idsOf(ctx.catalog().getByStatus(status)));
    });
}

std::future<DownloadList> DownloadEngine::removeAllInGroupWithStatus(int groupId, Status status) {
    return run([groupId, status](NamespaceContext& ctx) {
        return ctx.controlPlane().remove(
            ControlPlane::idsOf(ctx.catalog().getByGroupAndStatus(groupId, status)));
    });
}

// -- Delete --

std::future<DownloadList> DownloadEngine::deleteDownloads(const std::vector<int>& ids) {
    return run([ids](NamespaceContext& ctx) { return ctx.controlPlane().deleteDownloads(ids); });
}

std::future<OptionalDownload> DownloadEngine::deleteDownload(int id) {
    return run([id](NamespaceContext& ctx) { return first(ctx.controlPlane().deleteDownloads({id})); });
}

std::future<DownloadList> DownloadEngine::deleteGroup(int groupId) {
    return run([groupId](NamespaceContext& ctx) {
        return ctx.controlPlane().deleteDownloads(ControlPlane::idsOf(ctx.catalog().getByGroup(groupId)));
    });
}

std::future<DownloadList> DownloadEngine::deleteAll() {
    return run([](NamespaceContext& ctx) {
        return ctx.controlPlane().deleteDownloads(ControlPlane::idsOf(ctx.catalog().getAll()));
    });
}

std::future<DownloadList> DownloadEngine::deleteAllWithStatus(Status status) {
    return run([status](NamespaceContext& ctx) {
        return ctx.controlPlane().deleteDownloads(ControlPlane::idsOf(ctx.catalog().getByStatus(status)));
    });
}

std::future<DownloadList> DownloadEngine::deleteAllInGroupWithStatus(int groupId, Status status) {
    return run([groupId, status](NamespaceContext& ctx) {
        return ctx.controlPlane().deleteDownloads(
            ControlPlane::idsOf(ctx.catalog().getByGroupAndStatus(groupId, status)));
    });
}

// -- Cancel / retry --

std::future<DownloadList> DownloadEngine::cancel(const std::vector<int>& ids) {
    return run([ids](NamespaceContext& ctx) { return ctx.controlPlane().cancel(ids); });
}

std::future<OptionalDownload> DownloadEngine::cancel(int id) {
    return run([id](NamespaceContext& ctx) { return first(ctx.controlPlane().cancel({id})); });
}

std::future<DownloadList> DownloadEngine::cancelGroup(int groupId) {
    return run([groupId](NamespaceContext& ctx) {
        return ctx.controlPlane().cancel(ControlPlane::idsOf(ctx.catalog().getByGroup(groupId)));
    });
}

std::future<DownloadList> DownloadEngine::cancelAll() {
    return run([](NamespaceContext& ctx) {
        return ctx.controlPlane().cancel(ControlPlane::idsOf(ctx.catalog().getAll()));
    });
}

std::future<DownloadList> DownloadEngine::retry(const std::vector<int>& ids) {
    return run([ids](NamespaceContext& ctx) { return ctx.controlPlane().retry(ids); });
}

std::future<OptionalDownload> DownloadEngine::retry(int id) {
    return run([id](NamespaceContext& ctx) { return first(ctx.controlPlane().retry({id})); });
}

// -- Queries --

std::future<DownloadList> DownloadEngine::getDownloads() {
    return run([](NamespaceContext& ctx) { return ctx.catalog().getAll(); });
}

std::future<DownloadList> DownloadEngine::getDownloads(const std::vector<int>& ids) {
    return run([ids](NamespaceContext& ctx) { return ctx.catalog().get(ids); });
}

std::future<OptionalDownload> DownloadEngine::getDownload(int id) {
    return run([id](NamespaceContext& ctx) { return ctx.catalog().get(id); });
}

std::future<DownloadList> DownloadEngine::getDownloadsInGroup(int groupId) {
    return run([groupId](NamespaceContext& ctx) { return ctx.catalog().getByGroup(groupId); });
}

std::future<DownloadList> DownloadEngine::getDownloadsWithStatus(Status status) {
    return run([status](NamespaceContext& ctx) { return ctx.catalog().getByStatus(status); });
}

std::future<DownloadList> DownloadEngine::getDownloadsInGroupWithStatus(int groupId, Status status) {
    return run([groupId, status](NamespaceContext& ctx) { return ctx.catalog().getByGroupAndStatus(groupId, status); });
}

std::future<DownloadList> DownloadEngine::getDownloadsByRequestIdentifier(int64_t identifier) {
    return run([identifier](NamespaceContext& ctx) { return ctx.catalog().getByIdentifier(identifier); });
}

std::future<std::vector<DownloadBlock>> DownloadEngine::getDownloadBlocks(int id) {
    return run([id](NamespaceContext& ctx) { return ctx.catalog().getBlocks(id); });
}

std::future<int64_t> DownloadEngine::getContentLengthForRequest(const Request& request, bool fromServer) {
    const int id = request.id != 0 ? request.id : Request::makeId(request.url, request.file);

    std::future<int64_t> known = run([id](NamespaceContext& ctx) -> int64_t {
        auto row = ctx.catalog().get(id);
        return row && row->total > 0 ? row->total : -1;
    });

    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_context) {
            transport = m_context->transport();
        }
    }

    // The server query must not hold the namespace executor
    return std::async(std::launch::async,
        [known = std::move(known), transport, request, fromServer]() mutable -> int64_t {
            int64_t total = known.get();
            if (total > 0 || !fromServer || !transport) {
                return total;
            }
            return transport->fetchContentLength(request);
        });
}

// -- Listeners --

std::future<bool> DownloadEngine::addListener(const DownloadListenerPtr& listener, bool notifyOnAttach) {
    const uint64_t owner = m_instanceId;

    return run([listener, notifyOnAttach, owner](NamespaceContext& ctx) {
        bool added = ctx.listeners().add(listener, owner);
        if (added && notifyOnAttach) {
            for (const auto& download : ctx.catalog().getAll()) {
                ctx.listeners().replay(*listener, download);
            }
        }
        return added;
    });
}

std::future<bool> DownloadEngine::removeListener(const DownloadListenerPtr& listener) {
    return run([listener](NamespaceContext& ctx) { return ctx.listeners().remove(listener); });
}

// -- Settings --

std::future<void> DownloadEngine::setGlobalNetworkType(models::NetworkType type) {
    return run([type](NamespaceContext& ctx) { ctx.controlPlane().setGlobalNetworkType(type); });
}

std::future<void> DownloadEngine::setDownloadConcurrentLimit(int limit) {
    return run([limit](NamespaceContext& ctx) { ctx.controlPlane().setConcurrentLimit(limit); });
}

void DownloadEngine::enableLogging(bool enabled) {
    core::Logger::instance().setEnabled(enabled);
}

// -- Lifecycle --

void DownloadEngine::close() {
    std::shared_ptr<NamespaceContext> context;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        context = std::move(m_context);
    }

    if (context) {
        context->listeners().removeOwner(m_instanceId);
        NamespaceContext::release(std::move(context));
    }

    LOG_DEBUG("Engine instance {} on namespace {} closed", m_instanceId, m_nameSpace);
}

} // namespace downlink::engine
