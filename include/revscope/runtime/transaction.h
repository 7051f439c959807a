#ifndef REVSCOPE_RUNTIME_TRANSACTION_H
#define REVSCOPE_RUNTIME_TRANSACTION_H

#include <revscope/revscope_base.h>

#include <ankerl/unordered_dense.h>

#include <mutex>

namespace revscope {
    /**
     * The transactional primitive a revision scope wraps. The first ``enter_atomic`` on a thread begins a
     * transaction, nested calls create savepoints. Every ``enter_atomic`` is paired with exactly one
     * ``exit_atomic``, which commits (or releases the savepoint) when ``commit`` is true and rolls back otherwise.
     */
    struct REVSCOPE_EXPORT TransactionalResource {
        using ptr = std::shared_ptr<TransactionalResource>;

        virtual ~TransactionalResource() = default;

        [[nodiscard]] virtual const std::string &alias() const = 0;

        virtual void enter_atomic() = 0;

        virtual void exit_atomic(bool commit) = 0;
    };

    /**
     * A resource with no storage behind it, it only keeps the per-thread nesting depth. Used for the default alias
     * until the application installs its own resource.
     */
    struct REVSCOPE_EXPORT InProcessResource : TransactionalResource {
        explicit InProcessResource(std::string alias);

        [[nodiscard]] const std::string &alias() const override;

        void enter_atomic() override;

        void exit_atomic(bool commit) override;

        // Nesting depth on the calling thread.
        [[nodiscard]] std::size_t depth() const;

    private:
        std::string _alias;
    };

    /**
     * Process wide table of transactional resources by alias.
     */
    struct REVSCOPE_EXPORT ResourceRegistry {
        static ResourceRegistry &instance();

        ResourceRegistry();

        void register_resource(TransactionalResource::ptr resource);

        void unregister_resource(const std::string &alias);

        [[nodiscard]] bool has_resource(const std::string &alias) const;

        /**
         * The resource for the alias, an empty alias selects ``config().default_db``.
         */
        [[nodiscard]] TransactionalResource::ptr get_resource(const std::string &alias) const;

    private:
        mutable std::mutex _lock;
        ankerl::unordered_dense::map<std::string, TransactionalResource::ptr> _resources;
    };

    /**
     * Enters an atomic block for its life-time. ``close`` exits with the given intent, a block destroyed without
     * being closed rolls back.
     */
    struct REVSCOPE_EXPORT AtomicBlock {
        explicit AtomicBlock(TransactionalResource::ptr resource);

        AtomicBlock(const AtomicBlock &) = delete;

        AtomicBlock &operator=(const AtomicBlock &) = delete;

        ~AtomicBlock() noexcept;

        void close(bool commit);

        [[nodiscard]] bool is_open() const { return _open; }

        [[nodiscard]] const TransactionalResource &resource() const { return *_resource; }

    private:
        TransactionalResource::ptr _resource;
        bool _open{false};
    };
} // namespace revscope

#endif  // REVSCOPE_RUNTIME_TRANSACTION_H
