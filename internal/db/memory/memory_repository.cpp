#include "memory_repository.hpp"

#include <string>

#include "memory_tx.hpp"

namespace kinship::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::vector<model::RelationshipRecord> MemoryRepository::LoadAllEdges(Transaction& t) {
  std::vector<model::RelationshipRecord> out;
  for (const auto& e : TX(t).View().relationships)
    if (e.is_active) out.push_back(e);
  return out;
}

std::vector<model::RelationshipRecord> MemoryRepository::LoadEdgesTouching(Transaction& t, const std::string& person_id) {
  const auto& s  = TX(t).View();
  auto        it = s.edges_by_person.find(person_id);
  if (it == s.edges_by_person.end()) return {};

  std::vector<model::RelationshipRecord> out;
  for (std::size_t pos : it->second) {
    const auto& e = s.relationships[pos];
    if (e.is_active) out.push_back(e);
  }
  return out;
}

std::optional<model::PersonRecord> MemoryRepository::LookupPerson(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.persons.find(id);
  if (it == s.persons.end()) return std::nullopt;
  return it->second;
}

std::optional<model::AddressRecord> MemoryRepository::LookupCurrentAddress(Transaction& t, const std::string& person_id) {
  const auto& s  = TX(t).View();
  auto        it = s.addresses.find(person_id);
  if (it == s.addresses.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ReligionRecord> MemoryRepository::LookupReligion(Transaction& t, const std::string& person_id) {
  const auto& s  = TX(t).View();
  auto        it = s.religions.find(person_id);
  if (it == s.religions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertPerson(Transaction& t, const model::PersonRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "person id is empty");
  if (s.persons.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "person " + r.id);
  s.persons[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.persons.contains(r.person_id)) return Result::Err(ErrorCode::NotFound, "person " + r.person_id);
  if (!s.persons.contains(r.related_person_id)) return Result::Err(ErrorCode::NotFound, "person " + r.related_person_id);

  auto record = r;
  if (record.id.empty()) {
    record.id = "edge-" + std::to_string(s.next_relationship_id++);
  } else if (s.relationship_ids.contains(record.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "relationship " + record.id);
  }

  const std::size_t pos = s.relationships.size();
  s.edges_by_person[record.person_id].push_back(pos);
  if (record.related_person_id != record.person_id) s.edges_by_person[record.related_person_id].push_back(pos);
  s.relationship_ids.insert(record.id);
  s.relationships.push_back(std::move(record));
  return Result::Ok();
}

Result MemoryRepository::UpsertCurrentAddress(Transaction& t, const model::AddressRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.persons.contains(r.person_id)) return Result::Err(ErrorCode::NotFound, "person " + r.person_id);
  s.addresses[r.person_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertReligion(Transaction& t, const model::ReligionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.persons.contains(r.person_id)) return Result::Err(ErrorCode::NotFound, "person " + r.person_id);
  s.religions[r.person_id] = r;
  return Result::Ok();
}

} // namespace kinship::db::memory
