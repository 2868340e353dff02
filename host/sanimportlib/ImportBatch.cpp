/*
+------------------------------------------------------------------------------------+
File        : ImportBatch.cpp

Description : ImportBatch, statistics and report serialization

+------------------------------------------------------------------------------------+
*/
#include "ImportBatch.h"
#include "SanImportUtils.h"

namespace SanImportLib
{
    namespace
    {
        typedef boost::property_tree::ptree ptree;

        void PushValue(ptree& array, const std::string& value)
        {
            ptree item;
            item.put_value(value);
            array.push_back(std::make_pair(std::string(), item));
        }

        void PushId(ptree& array, SanObjectId id)
        {
            ptree item;
            item.put_value(id);
            array.push_back(std::make_pair(std::string(), item));
        }

        template <typename ITEM_TYPE>
        void PushObjects(ptree& node, const std::string& key, const std::vector<ITEM_TYPE>& items)
        {
            ptree array;
            typename std::vector<ITEM_TYPE>::const_iterator it = items.begin();
            for (/* empty */; it != items.end(); ++it)
            {
                ptree item;
                it->serialize(item);
                array.push_back(std::make_pair(std::string(), item));
            }
            node.add_child(key, array);
        }

        void SerializeAlias(const AliasReconciliation& alias, ptree& node)
        {
            AliasDto(alias.Candidate).serialize(node);
            if (alias.Candidate.Vsan)
            {
                node.put("vsan", *alias.Candidate.Vsan);
            }
            node.put("source", alias.Candidate.SourceName);
            node.put("origin_line", alias.Candidate.OriginLine);
            node.put("exists", alias.ExistsAlready);
            node.put("selected", alias.Selected);
            if (alias.Candidate.ClassificationNote)
            {
                node.put("note", *alias.Candidate.ClassificationNote);
            }
        }

        void SerializeZone(const ZoneReconciliation& zone, ptree& node)
        {
            const ZoneCandidate& candidate = zone.Candidate;
            node.put("name", candidate.Name);
            node.put("fabric", candidate.FabricId);
            if (candidate.Vsan)
            {
                node.put("vsan", *candidate.Vsan);
            }
            node.put("zone_type", ZoneTypeToString(candidate.Type));
            node.put("source", candidate.SourceName);
            node.put("origin_line", candidate.OriginLine);
            node.put("exists", zone.ExistsAlready);
            node.put("selected", zone.Selected);

            ptree members, batchMembers;
            MemberRefs_t::const_iterator it = candidate.Members.begin();
            for (/* empty */; it != candidate.Members.end(); ++it)
            {
                if (const PersistedMember* persisted = boost::get<PersistedMember>(&*it))
                {
                    PushId(members, persisted->AliasId);
                }
                else if (const InBatchMember* inBatch = boost::get<InBatchMember>(&*it))
                {
                    PushValue(batchMembers, inBatch->AliasName);
                }
            }
            node.add_child("members", members);
            node.add_child("batch_members", batchMembers);

            ptree unresolved;
            UnresolvedMembers_t::const_iterator unresolvedIt = candidate.Unresolved.begin();
            for (/* empty */; unresolvedIt != candidate.Unresolved.end(); ++unresolvedIt)
            {
                PushValue(unresolved, unresolvedIt->Kind + " " + unresolvedIt->RawToken);
            }
            node.add_child("unresolved", unresolved);
        }
    }

    void ImportStatistics::serialize(ptree& node) const
    {
        node.put("total_aliases", TotalAliases);
        node.put("new_aliases", NewAliases);
        node.put("existing_aliases", ExistingAliases);
        node.put("duplicates_removed", DuplicatesRemoved);
        node.put("conflicts_resolved", ConflictsResolved);
        node.put("smart_detected", SmartDetected);
        node.put("defaulted_roles", DefaultedRoles);
        node.put("total_zones", TotalZones);
        node.put("new_zones", NewZones);
        node.put("duplicate_zones_removed", DuplicateZonesRemoved);
        node.put("unresolved_members", UnresolvedMembers);
    }

    void UnmatchedMember::serialize(ptree& node) const
    {
        node.put("zone", ZoneName);
        node.put("source", SourceName);
        node.put("kind", Kind);
        node.put("token", RawToken);
        node.put("origin_line", OriginLine);
    }

    void SubmissionFailure::serialize(ptree& node) const
    {
        node.put("kind", Kind);
        node.put("name", Name);
        node.put("reason", Reason);
    }

    UnmatchedMembers_t ImportBatch::UnmatchedMembers() const
    {
        UnmatchedMembers_t unmatched;
        ZoneReconciliations_t::const_iterator zoneIt = Zones.begin();
        for (/* empty */; zoneIt != Zones.end(); ++zoneIt)
        {
            const ZoneCandidate& zone = zoneIt->Candidate;
            UnresolvedMembers_t::const_iterator it = zone.Unresolved.begin();
            for (/* empty */; it != zone.Unresolved.end(); ++it)
            {
                unmatched.push_back(UnmatchedMember(zone.Name, zone.SourceName, *it));
            }
        }
        return unmatched;
    }

    void ImportBatch::serialize(ptree& node) const
    {
        node.put("fabric", FabricId);

        ptree documents;
        SourceDocuments_t::const_iterator docIt = Documents.begin();
        for (/* empty */; docIt != Documents.end(); ++docIt)
        {
            ptree document;
            document.put("name", docIt->Name);
            document.put("format", SourceFormatToString(docIt->Format));
            documents.push_back(std::make_pair(std::string(), document));
        }
        node.add_child("documents", documents);

        ptree aliases;
        AliasReconciliations_t::const_iterator aliasIt = Aliases.begin();
        for (/* empty */; aliasIt != Aliases.end(); ++aliasIt)
        {
            ptree alias;
            SerializeAlias(*aliasIt, alias);
            aliases.push_back(std::make_pair(std::string(), alias));
        }
        node.add_child("aliases", aliases);

        ptree zones;
        ZoneReconciliations_t::const_iterator zoneIt = Zones.begin();
        for (/* empty */; zoneIt != Zones.end(); ++zoneIt)
        {
            ptree zone;
            SerializeZone(*zoneIt, zone);
            zones.push_back(std::make_pair(std::string(), zone));
        }
        node.add_child("zones", zones);

        ptree warnings;
        std::vector<std::string>::const_iterator warningIt = Warnings.begin();
        for (/* empty */; warningIt != Warnings.end(); ++warningIt)
        {
            PushValue(warnings, *warningIt);
        }
        node.add_child("warnings", warnings);

        ptree stats;
        Stats.serialize(stats);
        node.add_child("stats", stats);
    }

    void ImportBatch::Clear()
    {
        FabricId = 0;
        Documents.clear();
        Pool.clear();
        Aliases.clear();
        Zones.clear();
        Warnings.clear();
        Stats = ImportStatistics();
        PoolWwpns.clear();
    }

    const char* ImportEventTypeToString(ImportEventType type)
    {
        switch (type)
        {
        case EVENT_BATCH_PREPARED:
            return "BatchPrepared";
        case EVENT_ALIAS_SELECTION_CHANGED:
            return "AliasSelectionChanged";
        case EVENT_ZONE_SELECTION_CHANGED:
            return "ZoneSelectionChanged";
        case EVENT_BATCH_CLEARED:
            return "BatchCleared";
        default:
            return "SubmissionCompleted";
        }
    }

    void SubmissionReport::serialize(ptree& node) const
    {
        node.put("status", SiStatusToString(Status));
        node.put("refresh_confirmed", RefreshConfirmed);

        ptree aliasIds, zoneIds, skipped;
        std::vector<SanObjectId>::const_iterator idIt = CreatedAliasIds.begin();
        for (/* empty */; idIt != CreatedAliasIds.end(); ++idIt)
        {
            PushId(aliasIds, *idIt);
        }
        for (idIt = CreatedZoneIds.begin(); idIt != CreatedZoneIds.end(); ++idIt)
        {
            PushId(zoneIds, *idIt);
        }
        std::vector<std::string>::const_iterator nameIt = SkippedDuplicates.begin();
        for (/* empty */; nameIt != SkippedDuplicates.end(); ++nameIt)
        {
            PushValue(skipped, *nameIt);
        }
        node.add_child("created_alias_ids", aliasIds);
        node.add_child("created_zone_ids", zoneIds);
        node.add_child("skipped_duplicates", skipped);

        PushObjects(node, "failures", Failures);
        PushObjects(node, "unresolved_after_refresh", UnresolvedAfterRefresh);
    }

    std::string SubmissionReport::ToJson() const
    {
        ptree pt;
        serialize(pt);
        return WriteTypedJson(pt);
    }
}
