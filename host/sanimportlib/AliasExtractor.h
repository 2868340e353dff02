/*
+------------------------------------------------------------------------------------+
File        : AliasExtractor.h

Description : Converts device-alias and fcalias definitions into AliasCandidates,
              one per discovered WWPN.

+------------------------------------------------------------------------------------+
*/
#ifndef _ALIAS_EXTRACTOR_H
#define _ALIAS_EXTRACTOR_H

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "SanImportContracts.h"
#include "RoleResolver.h"

namespace SanImportLib
{
    class AliasExtractor
    {
    public:
        AliasExtractor(const AliasDefaults& defaults, SanObjectId fabricId)
            : m_defaults(defaults),
            m_fabricId(fabricId)
        {}

        /// \brief pending roles are resolved through this resolver when the role mode is smart
        void SetRoleResolver(RoleResolverPtr resolver) { m_roleResolver = resolver; }

        /// \brief appends the candidates found in the fragment
        ///
        /// recognizes
        /// \li device-alias name <N> pwwn <W>
        /// \li fcalias name <N> [vsan <V>] followed by member pwwn <W> (or bare pwwn <W>) lines
        /// \li fcalias name <N> vsan <V> ; member pwwn <W> [init|target|both]
        ///
        /// an fcalias header indented under a zone (show zone output) only owns the pwwn
        /// lines indented deeper than itself, the zone's direct members are not fcalias members
        ///
        /// unparsable lines and invalid WWPNs are skipped
        void Extract(const SourceLines_t& fragment,
            const std::string& sourceName,
            const boost::optional<int>& ambientVsan,
            AliasCandidates_t& candidates) const;

    private:
        struct FcaliasMember {
            size_t OriginLine;
            std::string Wwpn;
            boost::optional<AliasRole> Tag;
        };

        struct FcaliasBlock {
            FcaliasBlock() : OriginLine(0), Indent(0), Inline(false) {}
            size_t OriginLine;
            size_t Indent;

            /// \brief header indented under a zone, only pwwn lines indented deeper than Indent are members
            bool Inline;

            std::string Name;
            boost::optional<int> Vsan;
            std::vector<FcaliasMember> Members;
        };

        AliasCandidate MakeCandidate(size_t originLine,
            const std::string& sourceName,
            const std::string& name,
            const std::string& wwpn,
            AliasSyntax syntax,
            const boost::optional<int>& vsan,
            const boost::optional<AliasRole>& tag) const;

        void EmitFcalias(const FcaliasBlock& block,
            const std::string& sourceName,
            AliasCandidates_t& candidates) const;

        AliasDefaults m_defaults;
        SanObjectId m_fabricId;
        RoleResolverPtr m_roleResolver;
    };
}

#endif
