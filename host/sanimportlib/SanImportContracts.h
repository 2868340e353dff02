/*
+------------------------------------------------------------------------------------+
File        : SanImportContracts.h

Description : Candidate, persisted record and DTO types exchanged between the
              extractors, the reconciler, the orchestrator and the persistence client.

+------------------------------------------------------------------------------------+
*/
#ifndef _SAN_IMPORT_CONTRACTS_H
#define _SAN_IMPORT_CONTRACTS_H

#include <stdint.h>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <boost/property_tree/ptree.hpp>

namespace SanImportLib
{
    typedef int64_t SanObjectId;

    enum SourceFormat {
        FORMAT_UNKNOWN,
        FORMAT_TECH_SUPPORT_DUMP,
        FORMAT_ZONE_EXPORT,
        FORMAT_ALIAS_EXPORT
    };

    enum AliasRole {
        ROLE_INITIATOR,
        ROLE_TARGET,
        ROLE_BOTH,
        ROLE_PENDING_CLASSIFICATION
    };

    enum AliasSyntax {
        SYNTAX_DEVICE_ALIAS,
        SYNTAX_FCALIAS
    };

    enum RoleMode {
        ROLE_MODE_INITIATOR,
        ROLE_MODE_TARGET,
        ROLE_MODE_BOTH,
        ROLE_MODE_SMART
    };

    enum AliasSyntaxOverride {
        SYNTAX_OVERRIDE_ORIGINAL,
        SYNTAX_OVERRIDE_DEVICE_ALIAS,
        SYNTAX_OVERRIDE_FCALIAS
    };

    enum ConflictPolicy {
        CONFLICT_PREFER_DEVICE_ALIAS,
        CONFLICT_PREFER_FCALIAS
    };

    enum FcaliasMemberNaming {
        FCALIAS_NAMING_SHARED,
        FCALIAS_NAMING_SUFFIXED
    };

    enum ZoneType {
        ZONE_TYPE_STANDARD,
        ZONE_TYPE_SMART,
        ZONE_TYPE_PEER
    };

    enum ZoneTypeMode {
        ZONE_TYPE_MODE_DETECT,
        ZONE_TYPE_MODE_STANDARD,
        ZONE_TYPE_MODE_SMART,
        ZONE_TYPE_MODE_PEER
    };

    const char* SourceFormatToString(SourceFormat format);
    const char* AliasRoleToString(AliasRole role);
    const char* AliasSyntaxToString(AliasSyntax syntax);
    const char* ZoneTypeToString(ZoneType zoneType);

    bool ParseAliasRole(const std::string& value, AliasRole& role);
    bool ParseRoleMode(const std::string& value, RoleMode& mode);
    bool ParseAliasSyntaxOverride(const std::string& value, AliasSyntaxOverride& syntaxOverride);
    bool ParseConflictPolicy(const std::string& value, ConflictPolicy& policy);
    bool ParseFcaliasMemberNaming(const std::string& value, FcaliasMemberNaming& naming);
    bool ParseZoneTypeMode(const std::string& value, ZoneTypeMode& mode);

    /// \brief one line of a source document with its 1-based line number
    struct SourceLine {
        SourceLine() : Number(0) {}
        SourceLine(size_t number, const std::string& text) : Number(number), Text(text) {}

        size_t Number;
        std::string Text;
    };

    typedef std::vector<SourceLine> SourceLines_t;

    /// \brief raw uploaded or pasted text, transient
    class SourceDocument
    {
    public:
        SourceDocument() : Format(FORMAT_UNKNOWN) {}
        SourceDocument(const std::string& name, const std::string& text)
            : Name(name), Text(text), Format(FORMAT_UNKNOWN) {}

        /// \brief file name or any label the caller uses to identify the document
        std::string Name;

        std::string Text;

        /// \brief set by the orchestrator from the FormatClassifier
        SourceFormat Format;
    };

    typedef std::vector<SourceDocument> SourceDocuments_t;

    /// \brief defaults applied to every extracted alias
    class AliasDefaults
    {
    public:
        AliasDefaults()
            : Create(false),
            IncludeInZoning(false),
            Role(ROLE_MODE_INITIATOR),
            SyntaxOverride(SYNTAX_OVERRIDE_ORIGINAL),
            Policy(CONFLICT_PREFER_DEVICE_ALIAS),
            MemberNaming(FCALIAS_NAMING_SHARED)
        {}

        bool Create;
        bool IncludeInZoning;
        RoleMode Role;
        AliasSyntaxOverride SyntaxOverride;
        ConflictPolicy Policy;
        FcaliasMemberNaming MemberNaming;
    };

    /// \brief defaults applied to every extracted zone
    class ZoneDefaults
    {
    public:
        ZoneDefaults() : Create(false), Exists(false), TypeMode(ZONE_TYPE_MODE_DETECT) {}

        bool Create;
        bool Exists;
        ZoneTypeMode TypeMode;
    };

    class AliasCandidate
    {
    public:
        AliasCandidate()
            : OriginLine(0),
            FabricId(0),
            Role(ROLE_PENDING_CLASSIFICATION),
            Syntax(SYNTAX_DEVICE_ALIAS),
            Create(false),
            IncludeInZoning(false)
        {}

        /// \brief line of the source document the alias was read from
        size_t OriginLine;

        /// \brief name of the source document
        std::string SourceName;

        /// \brief never empty
        std::string Name;

        /// \brief 16 lowercase hex digits, colon grouped
        std::string Wwpn;

        SanObjectId FabricId;

        /// \brief set for fcalias definitions
        boost::optional<int> Vsan;

        AliasRole Role;
        AliasSyntax Syntax;
        bool Create;
        bool IncludeInZoning;

        /// \brief explains how the role was chosen or how a conflict was resolved
        boost::optional<std::string> ClassificationNote;
    };

    typedef std::vector<AliasCandidate> AliasCandidates_t;

    /// \brief zone member resolved to an alias already in storage
    struct PersistedMember {
        explicit PersistedMember(SanObjectId aliasId = 0) : AliasId(aliasId) {}
        SanObjectId AliasId;
    };

    /// \brief zone member resolved to an alias of the current batch, not yet persisted
    struct InBatchMember {
        explicit InBatchMember(const std::string& aliasName = std::string()) : AliasName(aliasName) {}
        std::string AliasName;
    };

    inline bool operator==(const PersistedMember& lhs, const PersistedMember& rhs)
    {
        return lhs.AliasId == rhs.AliasId;
    }

    inline bool operator==(const InBatchMember& lhs, const InBatchMember& rhs)
    {
        return lhs.AliasName == rhs.AliasName;
    }

    typedef boost::variant<PersistedMember, InBatchMember> MemberRef;
    typedef std::vector<MemberRef> MemberRefs_t;

    /// \brief a member token that matched no alias
    class UnresolvedMember
    {
    public:
        UnresolvedMember() : OriginLine(0) {}
        UnresolvedMember(const std::string& kind, const std::string& rawToken, size_t originLine)
            : Kind(kind), RawToken(rawToken), OriginLine(originLine) {}

        /// \brief pwwn, device-alias, fcalias, fcid or batch-alias
        std::string Kind;
        std::string RawToken;
        size_t OriginLine;
    };

    typedef std::vector<UnresolvedMember> UnresolvedMembers_t;

    class ZoneCandidate
    {
    public:
        ZoneCandidate() : OriginLine(0), FabricId(0), Type(ZONE_TYPE_STANDARD), Create(false), Exists(false) {}

        size_t OriginLine;
        std::string SourceName;
        std::string Name;
        SanObjectId FabricId;
        boost::optional<int> Vsan;
        ZoneType Type;
        bool Create;
        bool Exists;

        /// \brief in declaration order, no duplicates
        MemberRefs_t Members;

        UnresolvedMembers_t Unresolved;
    };

    typedef std::vector<ZoneCandidate> ZoneCandidates_t;

    class PersistedAlias
    {
    public:
        PersistedAlias() : Id(0), FabricId(0) {}
        PersistedAlias(SanObjectId id, const std::string& name, const std::string& wwpn, SanObjectId fabricId = 0)
            : Id(id), Name(name), Wwpn(wwpn), FabricId(fabricId) {}

        SanObjectId Id;
        std::string Name;

        /// \brief as stored, not necessarily normalized
        std::string Wwpn;

        SanObjectId FabricId;
    };

    typedef std::vector<PersistedAlias> PersistedAliases_t;

    class PersistedZone
    {
    public:
        PersistedZone() : Id(0), FabricId(0) {}
        PersistedZone(SanObjectId id, const std::string& name, SanObjectId fabricId)
            : Id(id), Name(name), FabricId(fabricId) {}

        SanObjectId Id;
        std::string Name;
        SanObjectId FabricId;
    };

    typedef std::vector<PersistedZone> PersistedZones_t;

    /// \brief candidate annotated by the ExistenceReconciler
    template <typename CANDIDATE>
    class ReconciliationResult
    {
    public:
        ReconciliationResult() : ExistsAlready(false), Selected(true) {}
        explicit ReconciliationResult(const CANDIDATE& candidate, bool existsAlready = false)
            : Candidate(candidate), ExistsAlready(existsAlready), Selected(!existsAlready) {}

        CANDIDATE Candidate;
        bool ExistsAlready;

        /// \brief whether the caller wants the candidate submitted
        bool Selected;
    };

    typedef ReconciliationResult<AliasCandidate> AliasReconciliation;
    typedef ReconciliationResult<ZoneCandidate> ZoneReconciliation;
    typedef std::vector<AliasReconciliation> AliasReconciliations_t;
    typedef std::vector<ZoneReconciliation> ZoneReconciliations_t;

    /// \brief alias as sent to the persistence backend
    /// internal fields (origin line, notes, existence flags) are not carried
    class AliasDto
    {
    public:
        AliasDto() : FabricId(0), Create(false), IncludeInZoning(false) {}
        explicit AliasDto(const AliasCandidate& candidate);

        std::string Name;
        std::string Wwpn;
        std::string Use;
        std::string CiscoAlias;
        SanObjectId FabricId;
        bool Create;
        bool IncludeInZoning;

        void serialize(boost::property_tree::ptree& node) const;
    };

    typedef std::vector<AliasDto> AliasDtos_t;

    /// \brief zone as sent to the persistence backend, members are persisted alias ids
    class ZoneDto
    {
    public:
        ZoneDto() : FabricId(0), Create(false), Exists(false) {}
        ZoneDto(const ZoneCandidate& candidate, const std::vector<SanObjectId>& members);

        std::string Name;
        SanObjectId FabricId;
        boost::optional<int> Vsan;
        std::string ZoneType;
        bool Create;
        bool Exists;
        std::vector<SanObjectId> Members;

        void serialize(boost::property_tree::ptree& node) const;
    };

    typedef std::vector<ZoneDto> ZoneDtos_t;

    /// \brief per-item error returned by a submission
    class SubmissionItemError
    {
    public:
        SubmissionItemError() : Duplicate(false) {}
        SubmissionItemError(const std::string& name, const std::string& reason, bool duplicate)
            : Name(name), Reason(reason), Duplicate(duplicate) {}

        std::string Name;
        std::string Reason;

        /// \brief the backend reported the item as already existing
        bool Duplicate;
    };

    typedef std::vector<SubmissionItemError> SubmissionItemErrors_t;

    class SubmissionResult
    {
    public:
        std::vector<SanObjectId> CreatedIds;
        SubmissionItemErrors_t Errors;
    };
}

#endif
