/*
+------------------------------------------------------------------------------------+
File        : SectionExtractor.h

Description : Line oriented state machine that isolates the device-alias database,
              fcalias and zone/zoneset sub-blocks of a tech-support dump.

+------------------------------------------------------------------------------------+
*/
#ifndef _SECTION_EXTRACTOR_H
#define _SECTION_EXTRACTOR_H

#include <vector>

#include <boost/optional.hpp>

#include "SanImportContracts.h"
#include "SanImportConstants.h"

namespace SanImportLib
{
    enum SectionKind {
        SECTION_DEVICE_ALIAS,
        SECTION_FCALIAS,
        SECTION_ZONE,
        SECTION_FALLBACK
    };

    /// \brief lines collected between a section banner and the end of the section
    class TextSection
    {
    public:
        explicit TextSection(SectionKind kind = SECTION_FALLBACK) : Kind(kind) {}

        SectionKind Kind;

        /// \brief VSAN parsed from the banner, ambient VSAN for the extractors
        boost::optional<int> Vsan;

        SourceLines_t Lines;
    };

    typedef std::vector<TextSection> TextSections_t;

    class ExtractedSections
    {
    public:
        ExtractedSections() : UsedFallback(false) {}

        TextSections_t Sections;

        /// \brief no section carried configuration syntax and the raw text was scanned instead
        bool UsedFallback;

        /// \brief sections the Alias Extractor reads: device-alias, fcalias, zone (fcalias definitions) and fallback
        std::vector<const TextSection*> AliasSections() const;

        /// \brief sections the Zone Extractor reads: zone and fallback
        std::vector<const TextSection*> ZoneSections() const;
    };

    class SectionExtractor
    {
    public:
        explicit SectionExtractor(size_t dividerMinLength = DEFAULT_DIVIDER_MIN_LENGTH)
            : m_dividerMinLength(dividerMinLength)
        {}

        void Extract(const SourceLines_t& lines, ExtractedSections& sections) const;

    private:
        enum ExtractorState {
            STATE_IDLE,
            STATE_IN_DEVICE_ALIAS_SHOW,
            STATE_IN_FCALIAS_SHOW,
            STATE_IN_ZONE_SHOW
        };

        bool IsDivider(const std::string& trimmed) const;

        void ExtractFallback(const SourceLines_t& lines, ExtractedSections& sections) const;

        static void Flush(TextSection& current, ExtractorState state, TextSections_t& sections);

        size_t m_dividerMinLength;
    };
}

#endif
