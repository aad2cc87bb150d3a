#pragma once

// TetherCore - lazy relationships over SQLite
//
// Usage:
//   #include <TetherCore.hpp>
//
//   auto post = tether::entity_type::define("Post", {{"title"}});
//   auto comment = tether::entity_type::define("Comment", {{"body"}, {"post_id", tether::column_type::integer}});
//   tether::builder::has_many(post, "comments", {{"dependent", "destroy"}});
//   tether::builder::belongs_to(comment, "post");
//
//   tether::tether_db db;                  // in-memory, or tether_db(configuration("path.db"))
//   auto p = db.build(post, {{"title", std::string("Hello")}});
//   p->many("comments").build({{"body", std::string("first")}});  // held in memory
//   p->save();                             // saves the post, then the comment
//
//   auto json = tether::serializer::serialize(*p);

#include "tether/types.hpp"
#include "tether/errors.hpp"
#include "tether/log.hpp"
#include "tether/db.hpp"
#include "tether/entity_type.hpp"
#include "tether/reflection.hpp"
#include "tether/accessor.hpp"
#include "tether/record.hpp"
#include "tether/scope.hpp"
#include "tether/association.hpp"
#include "tether/collection_association.hpp"
#include "tether/collection_proxy.hpp"
#include "tether/builder.hpp"
#include "tether/serializer.hpp"
#include "tether/tether.hpp"
