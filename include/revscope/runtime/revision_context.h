#ifndef REVSCOPE_RUNTIME_REVISION_CONTEXT_H
#define REVSCOPE_RUNTIME_REVISION_CONTEXT_H

#include <revscope/runtime/transaction.h>
#include <revscope/types/version_adapter.h>

#include <ankerl/unordered_dense.h>

#include <exception>
#include <type_traits>
#include <variant>

namespace revscope {
    /**
     * Who made the change. Opaque to revscope, it is carried through to the revision observers.
     */
    struct Actor {
        std::string id;
        std::string display_name;

        bool operator==(const Actor &) const = default;
    };

    /**
     * Base of the typed meta records that can be attached to a revision with ``add_meta``. Records are immutable
     * once added.
     */
    struct REVSCOPE_EXPORT RevisionMeta {
        virtual ~RevisionMeta() = default;

        [[nodiscard]] virtual std::string type_name() const = 0;
    };

    // A live entity captured for serialization at the end of the revision, or a snapshot taken eagerly.
    using CapturedObject = std::variant<entity_ptr, VersionData>;

    using ObjectMap = ankerl::unordered_dense::map<VersionId, CapturedObject, VersionIdHash>;

    struct ManagerObjects {
        std::weak_ptr<RevisionManager> manager;
        ObjectMap objects;
    };

    using ManagerObjectsMap = ankerl::unordered_dense::map<const RevisionManager *, ManagerObjects>;

    /**
     * The capture state of one nesting level.
     *
     * The block-scoped properties belong to the block that created the frame. The revision-scoped properties are
     * copied into nested frames and copied back when a nested block completes without being invalidated.
     */
    struct REVSCOPE_EXPORT RevisionContextStackFrame {
        // Block-scoped properties.
        bool manage_manually{false};
        bool is_invalid{false};
        // Revision-scoped properties.
        std::optional<Actor> user;
        std::string comment;
        bool ignore_duplicates{false};
        ManagerObjectsMap manager_objects;
        std::vector<meta_ptr> meta;

        [[nodiscard]] RevisionContextStackFrame fork(bool manage_manually) const;

        void join(RevisionContextStackFrame &&other);
    };

    /**
     * Delivered once per manager when the outermost revision block for a resource closes cleanly.
     */
    struct REVSCOPE_EXPORT RevisionReady {
        RevisionManager *manager{nullptr};
        entity_list objects;
        std::vector<VersionData> serialized_objects;
        std::optional<Actor> user;
        std::string comment;
        std::vector<meta_ptr> meta;
        bool ignore_duplicates{false};
        std::string db;
    };

    struct REVSCOPE_EXPORT RevisionObserver {
        virtual ~RevisionObserver() = default;

        virtual void on_revision_ready(const RevisionReady &revision) = 0;
    };

    struct RevisionContext;

    struct RevisionContextManager;

    // Finds the context manager a revision block should use, called each time a block is entered.
    using ContextResolver = std::function<RevisionContextManager &()>;

    /**
     * The stack of revision frames for one thread. Use ``for_current_thread`` to obtain the calling thread's
     * instance, instances are never shared between threads.
     */
    struct REVSCOPE_EXPORT RevisionContextManager {
        RevisionContextManager() = default;

        RevisionContextManager(const RevisionContextManager &) = delete;

        RevisionContextManager &operator=(const RevisionContextManager &) = delete;

        static RevisionContextManager &for_current_thread();

        /**
         * Whether there is an active revision for this thread.
         */
        [[nodiscard]] bool is_active() const { return !_stack.empty(); }

        [[nodiscard]] std::size_t depth() const { return _stack.size(); }

        // Open blocks for the resource alias on this thread.
        [[nodiscard]] std::size_t depth(const std::string &db) const;

        void start(bool manage_manually, const std::string &db);

        void invalidate();

        /**
         * Closes the current block. When this was the last open block for ``db`` and it is valid the revision is
         * handed to the observers of each manager with captured objects, before the frame is popped. The frame is
         * popped (and joined into its parent) even if an observer throws.
         */
        void end(const std::string &db);

        // Block-scoped properties.

        [[nodiscard]] bool is_managing_manually() const;

        [[nodiscard]] bool is_invalid() const;

        // Revision-scoped properties.

        void set_user(std::optional<Actor> user);

        [[nodiscard]] const std::optional<Actor> &get_user() const;

        void set_comment(std::string comment);

        [[nodiscard]] const std::string &get_comment() const;

        void set_ignore_duplicates(bool ignore_duplicates);

        [[nodiscard]] bool get_ignore_duplicates() const;

        void add_meta(meta_ptr meta);

        template<typename T, typename... Args>
            requires std::is_base_of_v<RevisionMeta, T>
        void add_meta(Args &&...args) {
            add_meta(std::make_shared<const T>(std::forward<Args>(args)...));
        }

        [[nodiscard]] const std::vector<meta_ptr> &get_meta() const;

        /**
         * Adds a live entity to the current revision, it is serialized by the observers once the revision closes.
         */
        void add_to_context(RevisionManager &manager, const entity_ptr &entity);

        /**
         * Serializes the entity and everything reachable through its followed relations now, for events after
         * which the entity can no longer be read.
         */
        void add_to_context_eager(RevisionManager &manager, const entity_ptr &entity);

        // The objects captured so far for the manager in the current frame.
        [[nodiscard]] const ObjectMap *captured_objects(const RevisionManager &manager) const;

        /**
         * Marks up a block of code as requiring a revision to be created, bound to this context manager.
         */
        [[nodiscard]] RevisionContext create_revision(bool manage_manually = false, std::string db = {});

    private:
        [[nodiscard]] RevisionContextStackFrame &current_frame();

        [[nodiscard]] const RevisionContextStackFrame &current_frame() const;

        ObjectMap &objects_for(RevisionManager &manager);

        // Hands the revisions of the frame to the managers' observers. Observers see a copy of the frame's state.
        void emit(const RevisionContextStackFrame &frame, const std::string &db) const;

        void pop_frame();

        std::vector<RevisionContextStackFrame> _stack;
        ankerl::unordered_dense::map<std::string, std::size_t> _db_depths;
    };

    struct RevisionBlock;

    /**
     * A reusable description of a revision block. Use it to run a callable inside a revision, to decorate a
     * callable so every call runs inside a revision, or open a ``RevisionBlock`` for block style use.
     *
     * The context manager is found through the resolver each time the context is entered, a context without one
     * uses the calling thread's manager. Decorated callables can be shared across threads as long as the resolver
     * resolves per thread.
     */
    struct REVSCOPE_EXPORT RevisionContext {
        explicit RevisionContext(ContextResolver context_resolver = {}, bool manage_manually = false,
                                 std::string db = {});

        [[nodiscard]] bool manage_manually() const { return _manage_manually; }

        [[nodiscard]] const std::string &db() const { return _db; }

        [[nodiscard]] RevisionContextManager &context_manager() const;

        /**
         * Enters the transactional resource, then pushes a frame. Every ``enter`` must be paired with an ``exit``
         * on the same thread.
         */
        void enter() const;

        /**
         * Ends the block entered last. A non-null ``error`` invalidates the frame first and rolls the transaction
         * back, otherwise the revision is emitted (if this closes the outermost block) and the transaction commits.
         * Emission failures roll back and propagate.
         */
        void exit(std::exception_ptr error = nullptr) const;

        template<typename Fn>
        auto operator()(Fn &&fn) const;

        template<typename Fn>
        auto wrap(Fn fn) const {
            return [context = *this, fn = std::move(fn)](auto &&...args) mutable {
                return context([&]() -> decltype(auto) {
                    return std::invoke(fn, std::forward<decltype(args)>(args)...);
                });
            };
        }

    private:
        ContextResolver _context_resolver;
        bool _manage_manually;
        std::string _db;
    };

    /**
     * Opens the revision block on construction: the transactional resource is entered first, then the frame is
     * pushed. ``close`` ends the block and commits, propagating observer failures after rolling back.
     *
     * The destructor closes a block that is still open and never throws. When it runs because an exception is
     * unwinding the stack the frame is invalidated and the transaction rolled back, otherwise it behaves like
     * ``close`` and logs any failure. Call ``close`` explicitly if you need failures to propagate.
     */
    struct REVSCOPE_EXPORT RevisionBlock {
        explicit RevisionBlock(const RevisionContext &context);

        RevisionBlock(const RevisionBlock &) = delete;

        RevisionBlock &operator=(const RevisionBlock &) = delete;

        ~RevisionBlock() noexcept;

        void close();

        // Invalidates the frame, ends the block and rolls back. Nothing is emitted.
        void abort();

        [[nodiscard]] bool is_open() const { return _open; }

        [[nodiscard]] const std::string &db() const { return _db; }

    private:
        RevisionContextManager &_context_manager;
        AtomicBlock _atomic;
        std::string _db;
        int _uncaught_on_entry;
        bool _open{false};
    };

    template<typename Fn>
    auto RevisionContext::operator()(Fn &&fn) const {
        RevisionBlock block{*this};
        if constexpr (std::is_void_v<std::invoke_result_t<Fn &>>) {
            std::invoke(fn);
            block.close();
        } else {
            auto result{std::invoke(fn)};
            block.close();
            return result;
        }
    }
} // namespace revscope

#endif  // REVSCOPE_RUNTIME_REVISION_CONTEXT_H
