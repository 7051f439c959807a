#include <revscope/runtime/transaction.h>
#include <revscope/util/config.h>
#include <revscope/util/errors.h>
#include <revscope/util/logging.h>

namespace revscope {
    namespace {
        // Depth per resource, per thread.
        ankerl::unordered_dense::map<const InProcessResource *, std::size_t> &in_process_depths() {
            thread_local ankerl::unordered_dense::map<const InProcessResource *, std::size_t> depths;
            return depths;
        }
    }

    InProcessResource::InProcessResource(std::string alias) : _alias{std::move(alias)} {}

    const std::string &InProcessResource::alias() const { return _alias; }

    void InProcessResource::enter_atomic() { ++in_process_depths()[this]; }

    void InProcessResource::exit_atomic(bool) {
        auto &depths{in_process_depths()};
        auto it{depths.find(this)};
        if (it == depths.end()) {
            throw_error<RevisionManagementError>("exit_atomic called on '{}' without a matching enter_atomic", _alias);
        }
        if (--(it->second) == 0) { depths.erase(it); }
    }

    std::size_t InProcessResource::depth() const {
        auto &depths{in_process_depths()};
        auto it{depths.find(this)};
        return it == depths.end() ? 0 : it->second;
    }

    ResourceRegistry &ResourceRegistry::instance() {
        static ResourceRegistry registry;
        return registry;
    }

    ResourceRegistry::ResourceRegistry() {
        auto alias{config().default_db};
        _resources.emplace(alias, std::make_shared<InProcessResource>(alias));
    }

    void ResourceRegistry::register_resource(TransactionalResource::ptr resource) {
        if (!resource) { throw_error<RevisionManagementError>("Cannot register a null transactional resource"); }
        std::lock_guard guard{_lock};
        _resources.insert_or_assign(resource->alias(), resource);
    }

    void ResourceRegistry::unregister_resource(const std::string &alias) {
        std::lock_guard guard{_lock};
        _resources.erase(alias);
    }

    bool ResourceRegistry::has_resource(const std::string &alias) const {
        std::lock_guard guard{_lock};
        return _resources.contains(alias.empty() ? config().default_db : alias);
    }

    TransactionalResource::ptr ResourceRegistry::get_resource(const std::string &alias) const {
        const std::string key{alias.empty() ? config().default_db : alias};
        std::lock_guard guard{_lock};
        auto it{_resources.find(key)};
        if (it == _resources.end()) {
            throw_error<RevisionManagementError>("No transactional resource is registered with the alias '{}'", key);
        }
        return it->second;
    }

    AtomicBlock::AtomicBlock(TransactionalResource::ptr resource) : _resource{std::move(resource)} {
        _resource->enter_atomic();
        _open = true;
    }

    AtomicBlock::~AtomicBlock() noexcept {
        if (!_open) { return; }
        try {
            close(false);
        } catch (const std::exception &e) {
            logger()->error("Rolling back '{}' failed: {}", _resource->alias(), e.what());
        } catch (...) {
            logger()->error("Rolling back '{}' failed with an unknown exception", _resource->alias());
        }
    }

    void AtomicBlock::close(bool commit) {
        if (!_open) { return; }
        _open = false;
        _resource->exit_atomic(commit);
    }
} // namespace revscope
