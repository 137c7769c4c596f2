//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements dependency-ordered kind initialization.
///
//===----------------------------------------------------------------------===//

#include "kindgen/Schema/SchemaBuilder.h"

#include <algorithm>
#include <utility>

#include "kindgen/Kinds/KindRegistry.h"
#include "kindgen/Support/Diagnostics.h"
#include "kindgen/Support/Errors.h"

namespace kindgen
{
namespace
{

class SchemaBuilder final : public KindResolver
{
public:
    SchemaBuilder(std::string                 name,
                  std::vector<KindDefinition> definitions,
                  const KindRegistry&         registry,
                  DiagnosticEngine&           diagnostics,
                  const SchemaBuildOptions&   options)
        : schema_(std::move(name))
        , definitions_(std::move(definitions))
        , registry_(registry)
        , diagnostics_(diagnostics)
        , options_(options)
    {
    }

    llvm::Expected<Schema> run()
    {
        if (auto err = createKinds())
        {
            return std::move(err);
        }
        state_.assign(schema_.size(), State::Unvisited);
        for (KindId id = 0; id < schema_.size(); ++id)
        {
            if (auto err = initialize(id))
            {
                return std::move(err);
            }
        }
        return std::move(schema_);
    }

    llvm::Expected<KindId> requireLayout(llvm::StringRef name) override
    {
        auto id = lookup(name);
        if (!id)
        {
            return id.takeError();
        }
        if (auto err = initialize(*id))
        {
            return std::move(err);
        }
        return *id;
    }

    llvm::Expected<KindId> lookup(llvm::StringRef name) override
    {
        if (const auto id = schema_.find(name))
        {
            return *id;
        }
        return referrerError("unknown kind '" + name + "'");
    }

    const Kind& kind(const KindId id) const override
    {
        return schema_.kind(id);
    }

    DiagnosticEngine& diagnostics() override
    {
        return diagnostics_;
    }

private:
    enum class State
    {
        Unvisited,
        Visiting,
        Done,
    };

    Schema                      schema_;
    std::vector<KindDefinition> definitions_;
    const KindRegistry&         registry_;
    DiagnosticEngine&           diagnostics_;
    SchemaBuildOptions          options_;
    std::vector<State>          state_;
    std::vector<KindId>         stack_;

    llvm::Error createKinds()
    {
        for (const auto& def : definitions_)
        {
            if (def.name.empty())
            {
                return makeSchemaError(KindErrorContext{"", def.category, "create"},
                                       def.location.str() + ": kind definition has an empty name");
            }
            if (const auto previous = schema_.find(def.name))
            {
                return makeSchemaError(KindErrorContext{def.name, def.category, "create"},
                                       def.location.str() + ": duplicate kind name '" + def.name +
                                           "', first defined at " + definitions_[*previous].location.str());
            }
            auto kind = registry_.create(def.category, def.name);
            if (!kind)
            {
                return kind.takeError();
            }
            schema_.add(def.name, std::move(*kind));
        }
        return llvm::Error::success();
    }

    llvm::Error initialize(const KindId id)
    {
        if (state_[id] == State::Done)
        {
            return llvm::Error::success();
        }
        if (state_[id] == State::Visiting)
        {
            return referrerError("cyclic member reference " + describeCycle(id));
        }
        if (stack_.size() >= options_.maxNestingDepth)
        {
            return referrerError("kind nesting exceeds the depth limit of " +
                                 llvm::Twine(options_.maxNestingDepth) + " at '" + definitions_[id].name + "'");
        }

        state_[id] = State::Visiting;
        stack_.push_back(id);
        auto err = schema_.mutableKind(id).initFromDef(definitions_[id], *this);
        stack_.pop_back();
        if (err)
        {
            return err;
        }
        state_[id] = State::Done;
        return llvm::Error::success();
    }

    /// Names the chain from the first visit of `id` back to `id`.
    std::string describeCycle(const KindId id) const
    {
        auto        first = std::find(stack_.begin(), stack_.end(), id);
        std::string out;
        for (auto it = first; it != stack_.end(); ++it)
        {
            out += definitions_[*it].name + " -> ";
        }
        out += definitions_[id].name;
        return out;
    }

    /// Error attributed to the kind whose layout is being computed.
    llvm::Error referrerError(const llvm::Twine& message) const
    {
        if (stack_.empty())
        {
            return makeSchemaError(KindErrorContext{"", "", "initFromDef"}, message);
        }
        const auto& def = definitions_[stack_.back()];
        return makeSchemaError(KindErrorContext{def.name, def.category, "initFromDef"},
                               def.location.str() + ": " + message);
    }
};

}  // namespace

llvm::Expected<Schema> buildSchema(std::string                 name,
                                   std::vector<KindDefinition> definitions,
                                   const KindRegistry&         registry,
                                   DiagnosticEngine&           diagnostics,
                                   const SchemaBuildOptions&   options)
{
    SchemaBuilder builder(std::move(name), std::move(definitions), registry, diagnostics, options);
    return builder.run();
}

llvm::Expected<Schema> buildSchema(std::string                 name,
                                   std::vector<KindDefinition> definitions,
                                   DiagnosticEngine&           diagnostics,
                                   const SchemaBuildOptions&   options)
{
    return buildSchema(std::move(name), std::move(definitions), KindRegistry::builtin(), diagnostics, options);
}

}  // namespace kindgen
