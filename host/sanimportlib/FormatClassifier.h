/*
+------------------------------------------------------------------------------------+
File        : FormatClassifier.h

Description : Labels a block of switch configuration text as a tech-support dump,
              a zone export, an alias export or unknown.

+------------------------------------------------------------------------------------+
*/
#ifndef _FORMAT_CLASSIFIER_H
#define _FORMAT_CLASSIFIER_H

#include <string>

#include "SanImportContracts.h"
#include "SanImportConstants.h"

namespace SanImportLib
{
    class FormatClassifier
    {
    public:
        explicit FormatClassifier(size_t dumpSizeThreshold = DEFAULT_DUMP_SIZE_THRESHOLD)
            : m_dumpSizeThreshold(dumpSizeThreshold)
        {}

        /// \brief dump markers or size first, then zone keywords, then alias syntax
        ///
        /// zone classification needs an explicit "zone name" or "zoneset name" declaration,
        /// member lines alone look like alias syntax and do not count
        SourceFormat Classify(const std::string& text) const;

        /// \brief true for a dashed, backtick or prompt style "show" banner
        /// \param command receives the command text after "show"
        static bool IsShowBanner(const std::string& line, std::string& command);

        static bool HasDumpMarker(const std::string& line);
        static bool IsAliasSyntax(const std::string& line);
        static bool IsZoneKeyword(const std::string& line);

    private:
        size_t m_dumpSizeThreshold;
    };
}

#endif
