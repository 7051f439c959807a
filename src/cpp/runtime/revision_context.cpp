#include <revscope/runtime/revision_context.h>
#include <revscope/runtime/revision_manager.h>
#include <revscope/util/errors.h>
#include <revscope/util/logging.h>

namespace revscope {
    RevisionContextStackFrame RevisionContextStackFrame::fork(bool manage_manually_) const {
        RevisionContextStackFrame frame;
        frame.manage_manually = manage_manually_;
        frame.is_invalid = false;
        frame.user = user;
        frame.comment = comment;
        frame.ignore_duplicates = ignore_duplicates;
        // Copies every manager's object map, the nested block must not write through to this frame.
        frame.manager_objects = manager_objects;
        frame.meta = meta;
        return frame;
    }

    void RevisionContextStackFrame::join(RevisionContextStackFrame &&other) {
        if (other.is_invalid) { return; }
        user = std::move(other.user);
        comment = std::move(other.comment);
        ignore_duplicates = other.ignore_duplicates;
        manager_objects = std::move(other.manager_objects);
        meta = std::move(other.meta);
    }

    RevisionContextManager &RevisionContextManager::for_current_thread() {
        thread_local RevisionContextManager context_manager;
        return context_manager;
    }

    std::size_t RevisionContextManager::depth(const std::string &db) const {
        auto it{_db_depths.find(db)};
        return it == _db_depths.end() ? 0 : it->second;
    }

    RevisionContextStackFrame &RevisionContextManager::current_frame() {
        if (!is_active()) { throw_error<RevisionManagementError>("There is no active revision for this thread"); }
        return _stack.back();
    }

    const RevisionContextStackFrame &RevisionContextManager::current_frame() const {
        if (!is_active()) { throw_error<RevisionManagementError>("There is no active revision for this thread"); }
        return _stack.back();
    }

    void RevisionContextManager::start(bool manage_manually, const std::string &db) {
        if (is_active()) {
            _stack.push_back(_stack.back().fork(manage_manually));
        } else {
            RevisionContextStackFrame frame;
            frame.manage_manually = manage_manually;
            _stack.push_back(std::move(frame));
        }
        ++_db_depths[db];
    }

    void RevisionContextManager::invalidate() { current_frame().is_invalid = true; }

    void RevisionContextManager::end(const std::string &db) {
        const auto &frame{current_frame()};
        auto depth_it{_db_depths.find(db)};
        if (depth_it == _db_depths.end()) {
            throw_error<RevisionManagementError>("No revision block is open for the resource '{}'", db);
        }
        const bool last_for_db{--(depth_it->second) == 0};
        if (last_for_db) {
            _db_depths.erase(depth_it);
            try {
                if (frame.is_invalid) {
                    logger()->debug("Revision for '{}' was invalidated, nothing is emitted", db);
                } else {
                    emit(frame, db);
                }
            } catch (...) {
                pop_frame();
                throw;
            }
        }
        pop_frame();
    }

    void RevisionContextManager::pop_frame() {
        auto popped{std::move(_stack.back())};
        _stack.pop_back();
        if (!_stack.empty()) { _stack.back().join(std::move(popped)); }
    }

    void RevisionContextManager::emit(const RevisionContextStackFrame &frame, const std::string &db) const {
        // Observers may capture into the closing frame, so every revision is built before any is delivered.
        std::vector<std::pair<RevisionManager::ptr, RevisionReady>> ready;
        for (const auto &[_, captured]: frame.manager_objects) {
            if (captured.objects.empty()) { continue; }
            auto manager{captured.manager.lock()};
            if (!manager) {
                logger()->debug("Dropping {} object(s) captured for a manager that has been destroyed",
                                captured.objects.size());
                continue;
            }
            RevisionReady revision;
            revision.manager = manager.get();
            for (const auto &[id, object]: captured.objects) {
                if (const auto *entity = std::get_if<entity_ptr>(&object)) {
                    revision.objects.push_back(*entity);
                } else {
                    revision.serialized_objects.push_back(std::get<VersionData>(object));
                }
            }
            revision.user = frame.user;
            revision.comment = frame.comment;
            revision.meta = frame.meta;
            revision.ignore_duplicates = frame.ignore_duplicates;
            revision.db = db;
            ready.emplace_back(std::move(manager), std::move(revision));
        }
        for (const auto &[manager, revision]: ready) {
            logger()->debug("Revision ready for manager '{}' on '{}': {} live, {} serialized", manager->slug(), db,
                            revision.objects.size(), revision.serialized_objects.size());
            manager->notify_revision_ready(revision);
        }
    }

    bool RevisionContextManager::is_managing_manually() const { return current_frame().manage_manually; }

    bool RevisionContextManager::is_invalid() const { return current_frame().is_invalid; }

    void RevisionContextManager::set_user(std::optional<Actor> user) { current_frame().user = std::move(user); }

    const std::optional<Actor> &RevisionContextManager::get_user() const { return current_frame().user; }

    void RevisionContextManager::set_comment(std::string comment) { current_frame().comment = std::move(comment); }

    const std::string &RevisionContextManager::get_comment() const { return current_frame().comment; }

    void RevisionContextManager::set_ignore_duplicates(bool ignore_duplicates) {
        current_frame().ignore_duplicates = ignore_duplicates;
    }

    bool RevisionContextManager::get_ignore_duplicates() const { return current_frame().ignore_duplicates; }

    void RevisionContextManager::add_meta(meta_ptr meta) {
        if (!meta) { throw_error<RevisionManagementError>("Cannot add a null meta record to the revision"); }
        current_frame().meta.push_back(std::move(meta));
    }

    const std::vector<meta_ptr> &RevisionContextManager::get_meta() const { return current_frame().meta; }

    ObjectMap &RevisionContextManager::objects_for(RevisionManager &manager) {
        auto &frame{current_frame()};
        auto [it, inserted] = frame.manager_objects.try_emplace(&manager);
        if (inserted) { it->second.manager = manager.weak_from_this(); }
        return it->second.objects;
    }

    void RevisionContextManager::add_to_context(RevisionManager &manager, const entity_ptr &entity) {
        if (!entity) { throw_error<RevisionManagementError>("Cannot add a null entity to the revision"); }
        auto adapter{manager.get_adapter(entity->entity_type())};
        objects_for(manager).insert_or_assign(adapter->get_version_id(*entity), CapturedObject{entity});
    }

    void RevisionContextManager::add_to_context_eager(RevisionManager &manager, const entity_ptr &entity) {
        if (!entity) { throw_error<RevisionManagementError>("Cannot add a null entity to the revision"); }
        auto &objects{objects_for(manager)};
        for (const auto &related: manager.follow_relationships(entity)) {
            auto adapter{manager.get_adapter(related->entity_type())};
            auto data{adapter->get_version_data(*related)};
            auto id{adapter->get_version_id(*related)};
            objects.insert_or_assign(std::move(id), CapturedObject{std::move(data)});
        }
    }

    const ObjectMap *RevisionContextManager::captured_objects(const RevisionManager &manager) const {
        const auto &frame{current_frame()};
        auto it{frame.manager_objects.find(&manager)};
        return it == frame.manager_objects.end() ? nullptr : &it->second.objects;
    }

    RevisionContext RevisionContextManager::create_revision(bool manage_manually, std::string db) {
        return RevisionContext{[this]() -> RevisionContextManager & { return *this; }, manage_manually, std::move(db)};
    }

    RevisionContext::RevisionContext(ContextResolver context_resolver, bool manage_manually, std::string db)
        : _context_resolver{std::move(context_resolver)}, _manage_manually{manage_manually}, _db{std::move(db)} {}

    RevisionContextManager &RevisionContext::context_manager() const {
        return _context_resolver ? _context_resolver() : RevisionContextManager::for_current_thread();
    }

    void RevisionContext::enter() const {
        auto resource{ResourceRegistry::instance().get_resource(_db)};
        resource->enter_atomic();
        try {
            context_manager().start(_manage_manually, resource->alias());
        } catch (...) {
            resource->exit_atomic(false);
            throw;
        }
    }

    void RevisionContext::exit(std::exception_ptr error) const {
        auto resource{ResourceRegistry::instance().get_resource(_db)};
        auto &manager{context_manager()};
        try {
            if (error) { manager.invalidate(); }
            manager.end(resource->alias());
        } catch (...) {
            resource->exit_atomic(false);
            throw;
        }
        resource->exit_atomic(!error);
    }

    RevisionBlock::RevisionBlock(const RevisionContext &context)
        : _context_manager{context.context_manager()},
          _atomic{ResourceRegistry::instance().get_resource(context.db())},
          _db{_atomic.resource().alias()},
          _uncaught_on_entry{std::uncaught_exceptions()} {
        _context_manager.start(context.manage_manually(), _db);
        _open = true;
    }

    RevisionBlock::~RevisionBlock() noexcept {
        if (!_open) { return; }
        try {
            if (std::uncaught_exceptions() > _uncaught_on_entry) {
                abort();
            } else {
                close();
            }
        } catch (const std::exception &e) {
            logger()->error("Closing the revision block on '{}' failed: {}", _db, e.what());
        } catch (...) {
            logger()->error("Closing the revision block on '{}' failed with an unknown exception", _db);
        }
    }

    void RevisionBlock::close() {
        if (!_open) { return; }
        _open = false;
        try {
            _context_manager.end(_db);
        } catch (...) {
            _atomic.close(false);
            throw;
        }
        _atomic.close(true);
    }

    void RevisionBlock::abort() {
        if (!_open) { return; }
        _open = false;
        try {
            _context_manager.invalidate();
            _context_manager.end(_db);
        } catch (...) {
            _atomic.close(false);
            throw;
        }
        _atomic.close(false);
    }
} // namespace revscope
