/*
+------------------------------------------------------------------------------------+
File        : RoleResolver.h

Description : Resolves pending alias roles through a RoleClassifier, caching one
              answer per WWPN for the lifetime of a batch.

+------------------------------------------------------------------------------------+
*/
#ifndef _ROLE_RESOLVER_H
#define _ROLE_RESOLVER_H

#include <map>
#include <string>

#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>

#include "RoleClassifier.h"

namespace SanImportLib
{
    class RoleResolver
    {
    public:
        /// \param classifier may be null, pending roles then default to initiator
        /// \param threads worker threads used for lookups, 1 classifies inline
        RoleResolver(RoleClassifierPtr classifier, unsigned int threads);

        /// \brief assigns a role and a classification note to every pending candidate
        ///
        /// a miss or a failed lookup never fails the candidate, it defaults to initiator
        void Resolve(AliasCandidates_t& candidates);

        /// \brief number of distinct WWPNs sent to the classifier so far
        size_t LookupCount() const;

    private:
        struct Classification {
            Classification() : Status(SIS_FALSE), Role(ROLE_INITIATOR) {}
            SISTATUS Status;
            AliasRole Role;
        };

        typedef std::map<std::string, Classification> ClassificationCache_t;

        void ClassifyRange(const std::vector<std::string>& wwpns,
            std::vector<Classification>& results,
            size_t first,
            size_t stride);

        RoleClassifierPtr m_classifier;
        unsigned int m_threads;

        ClassificationCache_t m_cache;
        mutable boost::mutex m_cacheLock;
    };

    typedef boost::shared_ptr<RoleResolver> RoleResolverPtr;
}

#endif
