#ifndef REVSCOPE_FORWARD_DECLARATIONS_H
#define REVSCOPE_FORWARD_DECLARATIONS_H

#include <memory>
#include <vector>

namespace revscope {
    struct EntityType;
    struct Entity;
    struct VersionId;
    struct VersionData;
    struct VersionAdapter;
    struct SerializationCodec;
    struct ChangeReceiver;
    struct ChangeEventDispatcher;
    struct TransactionalResource;
    struct RevisionMeta;
    struct RevisionReady;
    struct RevisionObserver;
    struct RevisionContextStackFrame;
    struct RevisionContextManager;
    struct RevisionContext;
    struct RevisionManager;
    struct VersionStore;

    using entity_ptr = std::shared_ptr<Entity>;
    using entity_list = std::vector<entity_ptr>;
    using adapter_ptr = std::shared_ptr<const VersionAdapter>;
    using meta_ptr = std::shared_ptr<const RevisionMeta>;
    using revision_manager_ptr = std::shared_ptr<RevisionManager>;
} // namespace revscope

#endif  // REVSCOPE_FORWARD_DECLARATIONS_H
