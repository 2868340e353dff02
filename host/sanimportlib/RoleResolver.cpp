/*
+------------------------------------------------------------------------------------+
File        : RoleResolver.cpp

Description : RoleResolver implementation

+------------------------------------------------------------------------------------+
*/
#include <algorithm>
#include <set>

#include <boost/bind.hpp>
#include <boost/ref.hpp>
#include <boost/thread/thread.hpp>

#include "RoleResolver.h"
#include "SanImportConstants.h"
#include "logger.h"

namespace SanImportLib
{
    RoleResolver::RoleResolver(RoleClassifierPtr classifier, unsigned int threads)
        : m_classifier(classifier),
        m_threads(threads ? threads : 1)
    {
    }

    size_t RoleResolver::LookupCount() const
    {
        boost::mutex::scoped_lock guard(m_cacheLock);
        return m_cache.size();
    }

    void RoleResolver::ClassifyRange(const std::vector<std::string>& wwpns,
        std::vector<Classification>& results,
        size_t first,
        size_t stride)
    {
        for (size_t i = first; i < wwpns.size(); i += stride)
        {
            Classification& classification = results[i];
            try
            {
                classification.Status = m_classifier->Classify(wwpns[i], classification.Role);
                if (SIS_OK == classification.Status && ROLE_PENDING_CLASSIFICATION == classification.Role)
                {
                    classification.Status = SIS_FALSE;
                }
            }
            catch (const std::exception& e)
            {
                DebugPrintf(SI_LOG_ERROR, "%s: classification of %s failed with exception %s\n",
                    FUNCTION_NAME, wwpns[i].c_str(), e.what());
                classification.Status = SIE_FAIL;
            }
        }
    }

    void RoleResolver::Resolve(AliasCandidates_t& candidates)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        std::vector<std::string> pending;
        if (m_classifier)
        {
            std::set<std::string> queued;
            boost::mutex::scoped_lock guard(m_cacheLock);
            AliasCandidates_t::const_iterator it = candidates.begin();
            for (/* empty */; it != candidates.end(); ++it)
            {
                if (ROLE_PENDING_CLASSIFICATION == it->Role &&
                    m_cache.find(it->Wwpn) == m_cache.end() &&
                    queued.insert(it->Wwpn).second)
                {
                    pending.push_back(it->Wwpn);
                }
            }
        }

        if (!pending.empty())
        {
            std::vector<Classification> results(pending.size());
            size_t workers = std::min<size_t>(m_threads, pending.size());

            DebugPrintf(SI_LOG_INFO, "%s: classifying %lu WWPNs with %lu workers\n",
                FUNCTION_NAME, pending.size(), workers);

            if (workers <= 1)
            {
                ClassifyRange(pending, results, 0, 1);
            }
            else
            {
                // every worker writes a disjoint set of result slots
                boost::thread_group group;
                for (size_t worker = 0; worker < workers; worker++)
                {
                    group.create_thread(boost::bind(&RoleResolver::ClassifyRange, this,
                        boost::cref(pending), boost::ref(results), worker, workers));
                }
                group.join_all();
            }

            boost::mutex::scoped_lock guard(m_cacheLock);
            for (size_t i = 0; i < pending.size(); i++)
            {
                m_cache[pending[i]] = results[i];
            }
        }

        AliasCandidates_t::iterator it = candidates.begin();
        for (/* empty */; it != candidates.end(); ++it)
        {
            if (ROLE_PENDING_CLASSIFICATION != it->Role)
            {
                continue;
            }

            it->Role = ROLE_INITIATOR;

            if (!m_classifier)
            {
                it->ClassificationNote = ClassificationNotes::NoClassifier;
                continue;
            }

            Classification classification;
            {
                boost::mutex::scoped_lock guard(m_cacheLock);
                ClassificationCache_t::const_iterator cached = m_cache.find(it->Wwpn);
                if (cached != m_cache.end())
                {
                    classification = cached->second;
                }
            }

            if (SIS_OK == classification.Status)
            {
                it->Role = classification.Role;
                it->ClassificationNote = ClassificationNotes::SmartDetected + AliasRoleToString(classification.Role);
            }
            else if (SIS_FALSE == classification.Status)
            {
                it->ClassificationNote = ClassificationNotes::NoRuleFound;
            }
            else
            {
                it->ClassificationNote = ClassificationNotes::ClassificationFailed +
                    SiStatusToString(classification.Status) + ClassificationNotes::DefaultedToInit;
                DebugPrintf(SI_LOG_WARNING, "%s: role lookup for %s (%s) failed with %s\n",
                    FUNCTION_NAME, it->Name.c_str(), it->Wwpn.c_str(), SiStatusToString(classification.Status));
            }
        }

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
    }
}
