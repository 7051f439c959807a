#include <revscope/runtime/revision_manager.h>
#include <revscope/util/errors.h>
#include <revscope/util/logging.h>

#include <algorithm>
#include <mutex>

namespace revscope {
    namespace {
        struct ManagerTable {
            std::mutex lock;
            ankerl::unordered_dense::map<std::string, std::weak_ptr<RevisionManager>> managers;
        };

        ManagerTable &manager_table() {
            static ManagerTable table;
            return table;
        }

        // Drops the slug entry if it still refers to ``manager`` (or to a manager that has gone away).
        void release_slug(const std::string &slug, const RevisionManager *manager) {
            auto &table{manager_table()};
            std::lock_guard guard{table.lock};
            auto it{table.managers.find(slug)};
            if (it == table.managers.end()) { return; }
            auto current{it->second.lock()};
            if (!current || current.get() == manager) { table.managers.erase(it); }
        }
    }

    RevisionManager::ptr RevisionManager::create(std::string slug, ContextResolver context_resolver,
                                                 ChangeEventDispatcher *dispatcher) {
        if (!context_resolver) {
            context_resolver = []() -> RevisionContextManager & { return RevisionContextManager::for_current_thread(); };
        }
        auto &table{manager_table()};
        std::lock_guard guard{table.lock};
        if (auto it{table.managers.find(slug)}; it != table.managers.end() && !it->second.expired()) {
            throw_error<RegistrationError>("A revision manager has already been created with the slug '{}'", slug);
        }
        ptr manager{new RevisionManager(slug, std::move(context_resolver),
                                        dispatcher == nullptr ? ChangeEventDispatcher::instance() : *dispatcher)};
        table.managers.insert_or_assign(std::move(slug), manager);
        logger()->debug("Created revision manager '{}'", manager->slug());
        return manager;
    }

    RevisionManager::ptr RevisionManager::get_manager(const std::string &slug) {
        auto &table{manager_table()};
        std::lock_guard guard{table.lock};
        if (auto it{table.managers.find(slug)}; it != table.managers.end()) {
            if (auto manager{it->second.lock()}; manager) { return manager; }
        }
        throw_error<RegistrationError>("No revision manager exists with the slug '{}'", slug);
    }

    bool RevisionManager::has_manager(const std::string &slug) {
        auto &table{manager_table()};
        std::lock_guard guard{table.lock};
        auto it{table.managers.find(slug)};
        return it != table.managers.end() && !it->second.expired();
    }

    std::vector<std::pair<std::string, RevisionManager::ptr>> RevisionManager::get_created_managers() {
        auto &table{manager_table()};
        std::lock_guard guard{table.lock};
        std::vector<std::pair<std::string, ptr>> managers;
        for (const auto &[slug, weak]: table.managers) {
            if (auto manager{weak.lock()}; manager) { managers.emplace_back(slug, std::move(manager)); }
        }
        return managers;
    }

    RevisionManager::RevisionManager(std::string slug, ContextResolver context_resolver,
                                     ChangeEventDispatcher &dispatcher)
        : _slug{std::move(slug)}, _context_resolver{std::move(context_resolver)}, _dispatcher{dispatcher} {}

    RevisionManager::~RevisionManager() {
        try {
            close();
        } catch (const std::exception &e) {
            logger()->error("Closing revision manager '{}' failed: {}", _slug, e.what());
        }
    }

    void RevisionManager::close() {
        decltype(_registered_models) registered;
        {
            std::unique_lock guard{_lock};
            if (_closed) { return; }
            _closed = true;
            registered = std::move(_registered_models);
            _registered_models.clear();
            _revision_observers.clear();
        }
        for (const auto &[entity_type, adapter]: registered) { disconnect(*entity_type, *adapter); }
        release_slug(_slug, this);
        logger()->debug("Closed revision manager '{}'", _slug);
    }

    bool RevisionManager::is_closed() const {
        std::shared_lock guard{_lock};
        return _closed;
    }

    bool RevisionManager::is_registered(const EntityType &entity_type) const {
        std::shared_lock guard{_lock};
        return _registered_models.contains(&entity_type);
    }

    std::vector<const EntityType *> RevisionManager::get_registered_models() const {
        std::shared_lock guard{_lock};
        std::vector<const EntityType *> models;
        models.reserve(_registered_models.size());
        for (const auto &[entity_type, _]: _registered_models) { models.push_back(entity_type); }
        return models;
    }

    const EntityType &RevisionManager::register_model(const EntityType &entity_type, const AdapterOverrides &overrides,
                                                      const AdapterFactory &adapter_factory) {
        if (!adapter_factory) { throw_error<RegistrationError>("No adapter factory given for {}", entity_type.label()); }
        auto adapter{adapter_factory(entity_type)};
        if (!adapter) {
            throw_error<RegistrationError>("The adapter factory for {} returned no adapter", entity_type.label());
        }
        if (!overrides.empty()) { adapter->apply(overrides); }
        adapter_ptr registered{std::move(adapter)};
        {
            std::unique_lock guard{_lock};
            if (_closed) {
                throw_error<RegistrationError>("Revision manager '{}' has been closed", _slug);
            }
            if (_registered_models.contains(&entity_type)) {
                throw_error<RegistrationError>("{} has already been registered with revision manager '{}'",
                                               entity_type.label(), _slug);
            }
            _registered_models.emplace(&entity_type, registered);
        }
        for (const auto &signal: registered->get_all_signals()) { _dispatcher.subscribe(entity_type, signal, this); }
        logger()->debug("Registered {} with revision manager '{}'", entity_type.label(), _slug);
        return entity_type;
    }

    adapter_ptr RevisionManager::get_adapter(const EntityType &entity_type) const {
        std::shared_lock guard{_lock};
        auto it{_registered_models.find(&entity_type)};
        if (it == _registered_models.end()) {
            throw_error<RegistrationError>("{} has not been registered with revision manager '{}'",
                                           entity_type.label(), _slug);
        }
        return it->second;
    }

    void RevisionManager::unregister(const EntityType &entity_type) {
        adapter_ptr adapter;
        {
            std::unique_lock guard{_lock};
            auto it{_registered_models.find(&entity_type)};
            if (it == _registered_models.end()) {
                throw_error<RegistrationError>("{} has not been registered with revision manager '{}'",
                                               entity_type.label(), _slug);
            }
            adapter = std::move(it->second);
            _registered_models.erase(it);
        }
        disconnect(entity_type, *adapter);
        logger()->debug("Unregistered {} from revision manager '{}'", entity_type.label(), _slug);
    }

    void RevisionManager::disconnect(const EntityType &entity_type, const VersionAdapter &adapter) {
        for (const auto &signal: adapter.get_all_signals()) { _dispatcher.unsubscribe(entity_type, signal, this); }
    }

    RevisionContextManager &RevisionManager::context_manager() const { return _context_resolver(); }

    RevisionContext RevisionManager::create_revision(bool manage_manually, std::string db) const {
        return RevisionContext{_context_resolver, manage_manually, std::move(db)};
    }

    entity_list RevisionManager::follow_relationships(const entity_ptr &instance) const {
        entity_list followed;
        ankerl::unordered_dense::set<EntityKey, EntityKeyHash> seen;
        std::vector<entity_ptr> pending{instance};
        while (!pending.empty()) {
            auto obj{std::move(pending.back())};
            pending.pop_back();
            if (!obj) { continue; }
            // Created and deleted within the same revision, there is nothing to follow.
            auto key{EntityKey::of(*obj)};
            if (!key || !seen.insert(std::move(*key)).second) { continue; }
            auto related{get_adapter(obj->entity_type())->get_followed_relations(*obj)};
            followed.push_back(std::move(obj));
            // Reverse so the first relation is visited first.
            pending.insert(pending.end(), std::make_move_iterator(related.rbegin()),
                           std::make_move_iterator(related.rend()));
        }
        return followed;
    }

    void RevisionManager::add_revision_observer(RevisionObserver *observer) {
        if (observer == nullptr) { return; }
        std::unique_lock guard{_lock};
        if (std::find(_revision_observers.begin(), _revision_observers.end(), observer) == _revision_observers.end()) {
            _revision_observers.push_back(observer);
        }
    }

    void RevisionManager::remove_revision_observer(RevisionObserver *observer) {
        std::unique_lock guard{_lock};
        auto it{std::find(_revision_observers.begin(), _revision_observers.end(), observer)};
        if (it != _revision_observers.end()) { _revision_observers.erase(it); }
    }

    void RevisionManager::notify_revision_ready(const RevisionReady &revision) const {
        std::vector<RevisionObserver *> observers;
        {
            std::shared_lock guard{_lock};
            observers = _revision_observers;
        }
        for (auto *observer: observers) { observer->on_revision_ready(revision); }
    }

    void RevisionManager::set_version_store(VersionStore::ptr store) {
        std::unique_lock guard{_lock};
        _version_store = std::move(store);
    }

    VersionStore::ptr RevisionManager::version_store() const {
        std::shared_lock guard{_lock};
        return _version_store;
    }

    VersionStore::ptr RevisionManager::require_version_store() const {
        std::shared_lock guard{_lock};
        if (!_version_store) {
            throw_error<RevisionManagementError>("Revision manager '{}' has no version store attached", _slug);
        }
        return _version_store;
    }

    const EntityType &RevisionManager::labels_for(const EntityType &entity_type) const {
        std::shared_lock guard{_lock};
        auto it{_registered_models.find(&entity_type)};
        if (it != _registered_models.end() && !it->second->for_concrete_model) { return entity_type; }
        return entity_type.concrete_type();
    }

    std::vector<VersionRecord> RevisionManager::get_for_object_reference(
        const EntityType &entity_type, const std::string &object_id, const std::string &db) const {
        const auto &labels{labels_for(entity_type)};
        return require_version_store()->versions_for_object(
            *this, VersionId{labels.app_label(), labels.model_name(), object_id}, db);
    }

    std::vector<VersionRecord> RevisionManager::get_for_object(const Entity &entity, const std::string &db) const {
        auto pk{entity.pk()};
        if (!pk) { return {}; }
        return get_for_object_reference(entity.entity_type(), *pk, db);
    }

    std::optional<VersionRecord> RevisionManager::get_for_date(const Entity &entity, revision_time_t date,
                                                               const std::string &db) const {
        for (auto &version: get_for_object(entity, db)) {
            if (version.date_created <= date) { return std::move(version); }
        }
        return std::nullopt;
    }

    std::vector<VersionRecord> RevisionManager::get_deleted(const EntityType &entity_type, const std::string &db,
                                                            const std::string &model_db) const {
        const auto &labels{labels_for(entity_type)};
        return require_version_store()->deleted_versions(*this, labels.app_label(), labels.model_name(), db,
                                                        model_db.empty() ? db : model_db);
    }

    void RevisionManager::on_change(const ChangeEvent &event, const entity_ptr &entity) {
        auto &context{context_manager()};
        if (!context.is_active() || context.is_managing_manually()) { return; }
        auto adapter{get_adapter(entity->entity_type())};
        if (adapter->is_eager_signal(event)) {
            context.add_to_context_eager(*this, entity);
        } else {
            context.add_to_context(*this, entity);
        }
    }

    RevisionManager &default_revision_manager() {
        static RevisionManager::ptr manager{RevisionManager::create("default")};
        return *manager;
    }
} // namespace revscope
