/**
 * @file standard_tags_data.cpp
 * @brief Standard DICOM tag names from the PS3.6 Data Dictionary
 *
 * Covers the attributes commonly found in image, structured report and
 * waveform objects. Tags missing here resolve to the "Unknown" name.
 *
 * @see DICOM PS3.6 - Data Dictionary
 */

#include "metaview/core/tag_info.hpp"
#include "metaview/encoding/vr_type.hpp"

#include <array>
#include <span>

namespace metaview::core {

namespace {

using VR = metaview::encoding::vr_type;

constexpr auto entry(uint16_t group, uint16_t element, VR vr,
                     std::string_view keyword, std::string_view name) -> tag_info {
    return tag_info{dicom_tag{group, element}, vr, keyword, name, false};
}

constexpr auto retired(uint16_t group, uint16_t element, VR vr,
                       std::string_view keyword, std::string_view name) -> tag_info {
    return tag_info{dicom_tag{group, element}, vr, keyword, name, true};
}

// clang-format off
constexpr std::array standard_tags = {
    // File Meta Information (0x0002)
    entry(0x0002, 0x0000, VR::UL, "FileMetaInformationGroupLength", "File Meta Information Group Length"),
    entry(0x0002, 0x0001, VR::OB, "FileMetaInformationVersion", "File Meta Information Version"),
    entry(0x0002, 0x0002, VR::UI, "MediaStorageSOPClassUID", "Media Storage SOP Class UID"),
    entry(0x0002, 0x0003, VR::UI, "MediaStorageSOPInstanceUID", "Media Storage SOP Instance UID"),
    entry(0x0002, 0x0010, VR::UI, "TransferSyntaxUID", "Transfer Syntax UID"),
    entry(0x0002, 0x0012, VR::UI, "ImplementationClassUID", "Implementation Class UID"),
    entry(0x0002, 0x0013, VR::SH, "ImplementationVersionName", "Implementation Version Name"),
    entry(0x0002, 0x0016, VR::AE, "SourceApplicationEntityTitle", "Source Application Entity Title"),
    entry(0x0002, 0x0017, VR::AE, "SendingApplicationEntityTitle", "Sending Application Entity Title"),
    entry(0x0002, 0x0018, VR::AE, "ReceivingApplicationEntityTitle", "Receiving Application Entity Title"),
    entry(0x0002, 0x0100, VR::UI, "PrivateInformationCreatorUID", "Private Information Creator UID"),
    entry(0x0002, 0x0102, VR::OB, "PrivateInformation", "Private Information"),

    // SOP Common Module (0x0008)
    entry(0x0008, 0x0005, VR::CS, "SpecificCharacterSet", "Specific Character Set"),
    entry(0x0008, 0x0006, VR::SQ, "LanguageCodeSequence", "Language Code Sequence"),
    entry(0x0008, 0x0008, VR::CS, "ImageType", "Image Type"),
    entry(0x0008, 0x0012, VR::DA, "InstanceCreationDate", "Instance Creation Date"),
    entry(0x0008, 0x0013, VR::TM, "InstanceCreationTime", "Instance Creation Time"),
    entry(0x0008, 0x0014, VR::UI, "InstanceCreatorUID", "Instance Creator UID"),
    entry(0x0008, 0x0016, VR::UI, "SOPClassUID", "SOP Class UID"),
    entry(0x0008, 0x0018, VR::UI, "SOPInstanceUID", "SOP Instance UID"),
    entry(0x0008, 0x001A, VR::UI, "RelatedGeneralSOPClassUID", "Related General SOP Class UID"),
    entry(0x0008, 0x001B, VR::UI, "OriginalSpecializedSOPClassUID", "Original Specialized SOP Class UID"),
    entry(0x0008, 0x0020, VR::DA, "StudyDate", "Study Date"),
    entry(0x0008, 0x0021, VR::DA, "SeriesDate", "Series Date"),
    entry(0x0008, 0x0022, VR::DA, "AcquisitionDate", "Acquisition Date"),
    entry(0x0008, 0x0023, VR::DA, "ContentDate", "Content Date"),
    entry(0x0008, 0x0030, VR::TM, "StudyTime", "Study Time"),
    entry(0x0008, 0x0031, VR::TM, "SeriesTime", "Series Time"),
    entry(0x0008, 0x0032, VR::TM, "AcquisitionTime", "Acquisition Time"),
    entry(0x0008, 0x0033, VR::TM, "ContentTime", "Content Time"),
    entry(0x0008, 0x0050, VR::SH, "AccessionNumber", "Accession Number"),
    entry(0x0008, 0x0052, VR::CS, "QueryRetrieveLevel", "Query/Retrieve Level"),
    entry(0x0008, 0x0054, VR::AE, "RetrieveAETitle", "Retrieve AE Title"),
    entry(0x0008, 0x0056, VR::CS, "InstanceAvailability", "Instance Availability"),
    entry(0x0008, 0x0058, VR::UI, "FailedSOPInstanceUIDList", "Failed SOP Instance UID List"),
    entry(0x0008, 0x0060, VR::CS, "Modality", "Modality"),
    entry(0x0008, 0x0061, VR::CS, "ModalitiesInStudy", "Modalities in Study"),
    entry(0x0008, 0x0062, VR::UI, "SOPClassesInStudy", "SOP Classes in Study"),
    entry(0x0008, 0x0064, VR::CS, "ConversionType", "Conversion Type"),
    entry(0x0008, 0x0068, VR::CS, "PresentationIntentType", "Presentation Intent Type"),
    entry(0x0008, 0x0070, VR::LO, "Manufacturer", "Manufacturer"),
    entry(0x0008, 0x0080, VR::LO, "InstitutionName", "Institution Name"),
    entry(0x0008, 0x0081, VR::ST, "InstitutionAddress", "Institution Address"),
    entry(0x0008, 0x0082, VR::SQ, "InstitutionCodeSequence", "Institution Code Sequence"),
    entry(0x0008, 0x0090, VR::PN, "ReferringPhysicianName", "Referring Physician's Name"),
    entry(0x0008, 0x0092, VR::ST, "ReferringPhysicianAddress", "Referring Physician's Address"),
    entry(0x0008, 0x0094, VR::SH, "ReferringPhysicianTelephoneNumbers", "Referring Physician's Telephone Numbers"),
    entry(0x0008, 0x0096, VR::SQ, "ReferringPhysicianIdentificationSequence", "Referring Physician Identification Sequence"),
    entry(0x0008, 0x0100, VR::SH, "CodeValue", "Code Value"),
    entry(0x0008, 0x0102, VR::SH, "CodingSchemeDesignator", "Coding Scheme Designator"),
    entry(0x0008, 0x0103, VR::SH, "CodingSchemeVersion", "Coding Scheme Version"),
    entry(0x0008, 0x0104, VR::LO, "CodeMeaning", "Code Meaning"),
    entry(0x0008, 0x0105, VR::CS, "MappingResource", "Mapping Resource"),
    entry(0x0008, 0x0106, VR::DT, "ContextGroupVersion", "Context Group Version"),
    entry(0x0008, 0x010F, VR::CS, "ContextIdentifier", "Context Identifier"),
    entry(0x0008, 0x0110, VR::SQ, "CodingSchemeIdentificationSequence", "Coding Scheme Identification Sequence"),
    entry(0x0008, 0x1010, VR::SH, "StationName", "Station Name"),
    entry(0x0008, 0x1030, VR::LO, "StudyDescription", "Study Description"),
    entry(0x0008, 0x103E, VR::LO, "SeriesDescription", "Series Description"),
    entry(0x0008, 0x1040, VR::LO, "InstitutionalDepartmentName", "Institutional Department Name"),
    entry(0x0008, 0x1048, VR::PN, "PhysiciansOfRecord", "Physician(s) of Record"),
    entry(0x0008, 0x1050, VR::PN, "PerformingPhysicianName", "Performing Physician's Name"),
    entry(0x0008, 0x1060, VR::PN, "NameOfPhysiciansReadingStudy", "Name of Physician(s) Reading Study"),
    entry(0x0008, 0x1070, VR::PN, "OperatorsName", "Operators' Name"),
    entry(0x0008, 0x1080, VR::LO, "AdmittingDiagnosesDescription", "Admitting Diagnoses Description"),
    entry(0x0008, 0x1084, VR::SQ, "AdmittingDiagnosesCodeSequence", "Admitting Diagnoses Code Sequence"),
    entry(0x0008, 0x1090, VR::LO, "ManufacturerModelName", "Manufacturer's Model Name"),
    entry(0x0008, 0x1110, VR::SQ, "ReferencedStudySequence", "Referenced Study Sequence"),
    entry(0x0008, 0x1111, VR::SQ, "ReferencedPerformedProcedureStepSequence", "Referenced Performed Procedure Step Sequence"),
    entry(0x0008, 0x1115, VR::SQ, "ReferencedSeriesSequence", "Referenced Series Sequence"),
    entry(0x0008, 0x1120, VR::SQ, "ReferencedPatientSequence", "Referenced Patient Sequence"),
    entry(0x0008, 0x1125, VR::SQ, "ReferencedVisitSequence", "Referenced Visit Sequence"),
    entry(0x0008, 0x1140, VR::SQ, "ReferencedImageSequence", "Referenced Image Sequence"),
    entry(0x0008, 0x1150, VR::UI, "ReferencedSOPClassUID", "Referenced SOP Class UID"),
    entry(0x0008, 0x1155, VR::UI, "ReferencedSOPInstanceUID", "Referenced SOP Instance UID"),
    entry(0x0008, 0x2111, VR::ST, "DerivationDescription", "Derivation Description"),
    entry(0x0008, 0x2112, VR::SQ, "SourceImageSequence", "Source Image Sequence"),

    // Patient Module (0x0010)
    entry(0x0010, 0x0010, VR::PN, "PatientName", "Patient's Name"),
    entry(0x0010, 0x0020, VR::LO, "PatientID", "Patient ID"),
    entry(0x0010, 0x0021, VR::LO, "IssuerOfPatientID", "Issuer of Patient ID"),
    entry(0x0010, 0x0022, VR::CS, "TypeOfPatientID", "Type of Patient ID"),
    entry(0x0010, 0x0024, VR::SQ, "IssuerOfPatientIDQualifiersSequence", "Issuer of Patient ID Qualifiers Sequence"),
    entry(0x0010, 0x0030, VR::DA, "PatientBirthDate", "Patient's Birth Date"),
    entry(0x0010, 0x0032, VR::TM, "PatientBirthTime", "Patient's Birth Time"),
    entry(0x0010, 0x0040, VR::CS, "PatientSex", "Patient's Sex"),
    entry(0x0010, 0x0050, VR::SQ, "PatientInsurancePlanCodeSequence", "Patient's Insurance Plan Code Sequence"),
    entry(0x0010, 0x0101, VR::SQ, "PatientPrimaryLanguageCodeSequence", "Patient's Primary Language Code Sequence"),
    entry(0x0010, 0x0102, VR::SQ, "PatientPrimaryLanguageModifierCodeSequence", "Patient's Primary Language Modifier Code Sequence"),
    retired(0x0010, 0x1000, VR::LO, "OtherPatientIDs", "Other Patient IDs"),
    entry(0x0010, 0x1001, VR::PN, "OtherPatientNames", "Other Patient Names"),
    entry(0x0010, 0x1002, VR::SQ, "OtherPatientIDsSequence", "Other Patient IDs Sequence"),
    entry(0x0010, 0x1005, VR::PN, "PatientBirthName", "Patient's Birth Name"),
    entry(0x0010, 0x1010, VR::AS, "PatientAge", "Patient's Age"),
    entry(0x0010, 0x1020, VR::DS, "PatientSize", "Patient's Size"),
    entry(0x0010, 0x1030, VR::DS, "PatientWeight", "Patient's Weight"),
    entry(0x0010, 0x1040, VR::LO, "PatientAddress", "Patient's Address"),
    entry(0x0010, 0x2000, VR::LO, "MedicalAlerts", "Medical Alerts"),
    entry(0x0010, 0x2110, VR::LO, "Allergies", "Allergies"),
    entry(0x0010, 0x2150, VR::LO, "CountryOfResidence", "Country of Residence"),
    entry(0x0010, 0x2152, VR::LO, "RegionOfResidence", "Region of Residence"),
    entry(0x0010, 0x2154, VR::SH, "PatientTelephoneNumbers", "Patient's Telephone Numbers"),
    entry(0x0010, 0x2160, VR::SH, "EthnicGroup", "Ethnic Group"),
    entry(0x0010, 0x2180, VR::SH, "Occupation", "Occupation"),
    entry(0x0010, 0x21A0, VR::CS, "SmokingStatus", "Smoking Status"),
    entry(0x0010, 0x21B0, VR::LT, "AdditionalPatientHistory", "Additional Patient History"),
    entry(0x0010, 0x21C0, VR::US, "PregnancyStatus", "Pregnancy Status"),
    entry(0x0010, 0x21D0, VR::DA, "LastMenstrualDate", "Last Menstrual Date"),
    entry(0x0010, 0x21F0, VR::LO, "PatientReligiousPreference", "Patient's Religious Preference"),
    entry(0x0010, 0x4000, VR::LT, "PatientComments", "Patient Comments"),

    // Study and Series Identification (0x0020)
    entry(0x0020, 0x000D, VR::UI, "StudyInstanceUID", "Study Instance UID"),
    entry(0x0020, 0x000E, VR::UI, "SeriesInstanceUID", "Series Instance UID"),
    entry(0x0020, 0x0010, VR::SH, "StudyID", "Study ID"),
    entry(0x0020, 0x0011, VR::IS, "SeriesNumber", "Series Number"),
    entry(0x0020, 0x0012, VR::IS, "AcquisitionNumber", "Acquisition Number"),
    entry(0x0020, 0x0013, VR::IS, "InstanceNumber", "Instance Number"),
    entry(0x0020, 0x0020, VR::CS, "PatientOrientation", "Patient Orientation"),
    entry(0x0020, 0x0032, VR::DS, "ImagePositionPatient", "Image Position (Patient)"),
    entry(0x0020, 0x0037, VR::DS, "ImageOrientationPatient", "Image Orientation (Patient)"),
    entry(0x0020, 0x0052, VR::UI, "FrameOfReferenceUID", "Frame of Reference UID"),
    entry(0x0020, 0x0060, VR::CS, "Laterality", "Laterality"),
    entry(0x0020, 0x0062, VR::CS, "ImageLaterality", "Image Laterality"),
    entry(0x0020, 0x0100, VR::IS, "TemporalPositionIdentifier", "Temporal Position Identifier"),
    entry(0x0020, 0x0105, VR::IS, "NumberOfTemporalPositions", "Number of Temporal Positions"),
    entry(0x0020, 0x0110, VR::DS, "TemporalResolution", "Temporal Resolution"),
    entry(0x0020, 0x0200, VR::UI, "SynchronizationFrameOfReferenceUID", "Synchronization Frame of Reference UID"),
    entry(0x0020, 0x1040, VR::LO, "PositionReferenceIndicator", "Position Reference Indicator"),
    entry(0x0020, 0x1041, VR::DS, "SliceLocation", "Slice Location"),
    entry(0x0020, 0x1200, VR::IS, "NumberOfPatientRelatedStudies", "Number of Patient Related Studies"),
    entry(0x0020, 0x1202, VR::IS, "NumberOfPatientRelatedSeries", "Number of Patient Related Series"),
    entry(0x0020, 0x1204, VR::IS, "NumberOfPatientRelatedInstances", "Number of Patient Related Instances"),
    entry(0x0020, 0x1206, VR::IS, "NumberOfStudyRelatedSeries", "Number of Study Related Series"),
    entry(0x0020, 0x1208, VR::IS, "NumberOfStudyRelatedInstances", "Number of Study Related Instances"),
    entry(0x0020, 0x1209, VR::IS, "NumberOfSeriesRelatedInstances", "Number of Series Related Instances"),
    entry(0x0020, 0x4000, VR::LT, "ImageComments", "Image Comments"),

    // Image Pixel Module (0x0028)
    entry(0x0028, 0x0002, VR::US, "SamplesPerPixel", "Samples per Pixel"),
    entry(0x0028, 0x0003, VR::US, "SamplesPerPixelUsed", "Samples per Pixel Used"),
    entry(0x0028, 0x0004, VR::CS, "PhotometricInterpretation", "Photometric Interpretation"),
    entry(0x0028, 0x0006, VR::US, "PlanarConfiguration", "Planar Configuration"),
    entry(0x0028, 0x0008, VR::IS, "NumberOfFrames", "Number of Frames"),
    entry(0x0028, 0x0009, VR::AT, "FrameIncrementPointer", "Frame Increment Pointer"),
    entry(0x0028, 0x0010, VR::US, "Rows", "Rows"),
    entry(0x0028, 0x0011, VR::US, "Columns", "Columns"),
    entry(0x0028, 0x0030, VR::DS, "PixelSpacing", "Pixel Spacing"),
    entry(0x0028, 0x0034, VR::IS, "PixelAspectRatio", "Pixel Aspect Ratio"),
    entry(0x0028, 0x0100, VR::US, "BitsAllocated", "Bits Allocated"),
    entry(0x0028, 0x0101, VR::US, "BitsStored", "Bits Stored"),
    entry(0x0028, 0x0102, VR::US, "HighBit", "High Bit"),
    entry(0x0028, 0x0103, VR::US, "PixelRepresentation", "Pixel Representation"),
    entry(0x0028, 0x0106, VR::US, "SmallestImagePixelValue", "Smallest Image Pixel Value"),
    entry(0x0028, 0x0107, VR::US, "LargestImagePixelValue", "Largest Image Pixel Value"),
    entry(0x0028, 0x0108, VR::US, "SmallestPixelValueInSeries", "Smallest Pixel Value in Series"),
    entry(0x0028, 0x0109, VR::US, "LargestPixelValueInSeries", "Largest Pixel Value in Series"),
    entry(0x0028, 0x0120, VR::US, "PixelPaddingValue", "Pixel Padding Value"),
    entry(0x0028, 0x0121, VR::US, "PixelPaddingRangeLimit", "Pixel Padding Range Limit"),
    entry(0x0028, 0x0300, VR::CS, "QualityControlImage", "Quality Control Image"),
    entry(0x0028, 0x0301, VR::CS, "BurnedInAnnotation", "Burned In Annotation"),
    entry(0x0028, 0x1050, VR::DS, "WindowCenter", "Window Center"),
    entry(0x0028, 0x1051, VR::DS, "WindowWidth", "Window Width"),
    entry(0x0028, 0x1052, VR::DS, "RescaleIntercept", "Rescale Intercept"),
    entry(0x0028, 0x1053, VR::DS, "RescaleSlope", "Rescale Slope"),
    entry(0x0028, 0x1054, VR::LO, "RescaleType", "Rescale Type"),
    entry(0x0028, 0x1055, VR::LO, "WindowCenterWidthExplanation", "Window Center & Width Explanation"),
    entry(0x0028, 0x1056, VR::CS, "VOILUTFunction", "VOI LUT Function"),
    entry(0x0028, 0x1101, VR::US, "RedPaletteColorLookupTableDescriptor", "Red Palette Color Lookup Table Descriptor"),
    entry(0x0028, 0x1102, VR::US, "GreenPaletteColorLookupTableDescriptor", "Green Palette Color Lookup Table Descriptor"),
    entry(0x0028, 0x1103, VR::US, "BluePaletteColorLookupTableDescriptor", "Blue Palette Color Lookup Table Descriptor"),
    entry(0x0028, 0x1199, VR::UI, "PaletteColorLookupTableUID", "Palette Color Lookup Table UID"),
    entry(0x0028, 0x1201, VR::OW, "RedPaletteColorLookupTableData", "Red Palette Color Lookup Table Data"),
    entry(0x0028, 0x1202, VR::OW, "GreenPaletteColorLookupTableData", "Green Palette Color Lookup Table Data"),
    entry(0x0028, 0x1203, VR::OW, "BluePaletteColorLookupTableData", "Blue Palette Color Lookup Table Data"),
    entry(0x0028, 0x2110, VR::CS, "LossyImageCompression", "Lossy Image Compression"),
    entry(0x0028, 0x2112, VR::DS, "LossyImageCompressionRatio", "Lossy Image Compression Ratio"),
    entry(0x0028, 0x2114, VR::CS, "LossyImageCompressionMethod", "Lossy Image Compression Method"),
    entry(0x0028, 0x3000, VR::SQ, "ModalityLUTSequence", "Modality LUT Sequence"),
    entry(0x0028, 0x3010, VR::SQ, "VOILUTSequence", "VOI LUT Sequence"),

    // Scheduled Procedure Step (0x0040)
    entry(0x0040, 0x0001, VR::AE, "ScheduledStationAETitle", "Scheduled Station AE Title"),
    entry(0x0040, 0x0002, VR::DA, "ScheduledProcedureStepStartDate", "Scheduled Procedure Step Start Date"),
    entry(0x0040, 0x0003, VR::TM, "ScheduledProcedureStepStartTime", "Scheduled Procedure Step Start Time"),
    entry(0x0040, 0x0004, VR::DA, "ScheduledProcedureStepEndDate", "Scheduled Procedure Step End Date"),
    entry(0x0040, 0x0005, VR::TM, "ScheduledProcedureStepEndTime", "Scheduled Procedure Step End Time"),
    entry(0x0040, 0x0006, VR::PN, "ScheduledPerformingPhysicianName", "Scheduled Performing Physician's Name"),
    entry(0x0040, 0x0007, VR::LO, "ScheduledProcedureStepDescription", "Scheduled Procedure Step Description"),
    entry(0x0040, 0x0008, VR::SQ, "ScheduledProtocolCodeSequence", "Scheduled Protocol Code Sequence"),
    entry(0x0040, 0x0009, VR::SH, "ScheduledProcedureStepID", "Scheduled Procedure Step ID"),
    entry(0x0040, 0x000A, VR::SQ, "StageCodeSequence", "Stage Code Sequence"),
    entry(0x0040, 0x000B, VR::SQ, "ScheduledPerformingPhysicianIdentificationSequence", "Scheduled Performing Physician Identification Sequence"),
    entry(0x0040, 0x0010, VR::SH, "ScheduledStationName", "Scheduled Station Name"),
    entry(0x0040, 0x0011, VR::SH, "ScheduledProcedureStepLocation", "Scheduled Procedure Step Location"),
    entry(0x0040, 0x0012, VR::LO, "PreMedication", "Pre-Medication"),
    entry(0x0040, 0x0020, VR::CS, "ScheduledProcedureStepStatus", "Scheduled Procedure Step Status"),
    entry(0x0040, 0x0100, VR::SQ, "ScheduledProcedureStepSequence", "Scheduled Procedure Step Sequence"),
    entry(0x0040, 0x0220, VR::SQ, "ReferencedNonImageCompositeSOPInstanceSequence", "Referenced Non-Image Composite SOP Instance Sequence"),
    entry(0x0040, 0x0241, VR::AE, "PerformedStationAETitle", "Performed Station AE Title"),
    entry(0x0040, 0x0242, VR::SH, "PerformedStationName", "Performed Station Name"),
    entry(0x0040, 0x0243, VR::SH, "PerformedLocation", "Performed Location"),
    entry(0x0040, 0x0244, VR::DA, "PerformedProcedureStepStartDate", "Performed Procedure Step Start Date"),
    entry(0x0040, 0x0245, VR::TM, "PerformedProcedureStepStartTime", "Performed Procedure Step Start Time"),
    entry(0x0040, 0x0250, VR::DA, "PerformedProcedureStepEndDate", "Performed Procedure Step End Date"),
    entry(0x0040, 0x0251, VR::TM, "PerformedProcedureStepEndTime", "Performed Procedure Step End Time"),
    entry(0x0040, 0x0252, VR::CS, "PerformedProcedureStepStatus", "Performed Procedure Step Status"),
    entry(0x0040, 0x0253, VR::SH, "PerformedProcedureStepID", "Performed Procedure Step ID"),
    entry(0x0040, 0x0254, VR::LO, "PerformedProcedureStepDescription", "Performed Procedure Step Description"),
    entry(0x0040, 0x0255, VR::LO, "PerformedProcedureTypeDescription", "Performed Procedure Type Description"),
    entry(0x0040, 0x0260, VR::SQ, "PerformedProtocolCodeSequence", "Performed Protocol Code Sequence"),
    entry(0x0040, 0x0270, VR::SQ, "ScheduledStepAttributesSequence", "Scheduled Step Attributes Sequence"),
    entry(0x0040, 0x0275, VR::SQ, "RequestAttributesSequence", "Request Attributes Sequence"),
    entry(0x0040, 0x0280, VR::ST, "CommentsOnThePerformedProcedureStep", "Comments on the Performed Procedure Step"),
    entry(0x0040, 0x0340, VR::SQ, "PerformedSeriesSequence", "Performed Series Sequence"),
    entry(0x0040, 0x1001, VR::SH, "RequestedProcedureID", "Requested Procedure ID"),
    entry(0x0040, 0x1002, VR::LO, "ReasonForTheRequestedProcedure", "Reason for the Requested Procedure"),
    entry(0x0040, 0x1003, VR::SH, "RequestedProcedurePriority", "Requested Procedure Priority"),
    entry(0x0040, 0x1004, VR::LO, "PatientTransportArrangements", "Patient Transport Arrangements"),
    entry(0x0040, 0x1005, VR::LO, "RequestedProcedureLocation", "Requested Procedure Location"),
    entry(0x0040, 0x1008, VR::LO, "ConfidentialityCode", "Confidentiality Code"),
    entry(0x0040, 0x1009, VR::SH, "ReportingPriority", "Reporting Priority"),
    entry(0x0040, 0x100A, VR::SQ, "ReasonForRequestedProcedureCodeSequence", "Reason for Requested Procedure Code Sequence"),
    entry(0x0040, 0x1010, VR::PN, "NamesOfIntendedRecipientsOfResults", "Names of Intended Recipients of Results"),
    entry(0x0040, 0x1011, VR::SQ, "IntendedRecipientsOfResultsIdentificationSequence", "Intended Recipients of Results Identification Sequence"),
    entry(0x0040, 0x1012, VR::SQ, "ReasonForPerformedProcedureCodeSequence", "Reason For Performed Procedure Code Sequence"),
    retired(0x0040, 0x2001, VR::LO, "ReasonForTheImagingServiceRequest", "Reason for the Imaging Service Request"),
    entry(0x0040, 0x2004, VR::DA, "IssueDateOfImagingServiceRequest", "Issue Date of Imaging Service Request"),
    entry(0x0040, 0x2005, VR::TM, "IssueTimeOfImagingServiceRequest", "Issue Time of Imaging Service Request"),
    entry(0x0040, 0x2008, VR::PN, "OrderEnteredBy", "Order Entered By"),
    entry(0x0040, 0x2009, VR::SH, "OrderEntererLocation", "Order Enterer's Location"),
    entry(0x0040, 0x2010, VR::SH, "OrderCallbackPhoneNumber", "Order Callback Phone Number"),
    entry(0x0040, 0x2016, VR::LO, "PlacerOrderNumberImagingServiceRequest", "Placer Order Number / Imaging Service Request"),
    entry(0x0040, 0x2017, VR::LO, "FillerOrderNumberImagingServiceRequest", "Filler Order Number / Imaging Service Request"),
    entry(0x0040, 0x2400, VR::LT, "ImagingServiceRequestComments", "Imaging Service Request Comments"),
    entry(0x0040, 0x3001, VR::LO, "ConfidentialityConstraintOnPatientDataDescription", "Confidentiality Constraint on Patient Data Description"),
    entry(0x0040, 0xA010, VR::CS, "RelationshipType", "Relationship Type"),
    entry(0x0040, 0xA027, VR::LO, "VerifyingOrganization", "Verifying Organization"),
    entry(0x0040, 0xA030, VR::DT, "VerificationDateTime", "Verification Date Time"),
    entry(0x0040, 0xA032, VR::DT, "ObservationDateTime", "Observation DateTime"),
    entry(0x0040, 0xA040, VR::CS, "ValueType", "Value Type"),
    entry(0x0040, 0xA043, VR::SQ, "ConceptNameCodeSequence", "Concept Name Code Sequence"),
    entry(0x0040, 0xA050, VR::CS, "ContinuityOfContent", "Continuity Of Content"),
    entry(0x0040, 0xA073, VR::SQ, "VerifyingObserverSequence", "Verifying Observer Sequence"),
    entry(0x0040, 0xA075, VR::PN, "VerifyingObserverName", "Verifying Observer Name"),
    entry(0x0040, 0xA088, VR::SQ, "VerifyingObserverIdentificationCodeSequence", "Verifying Observer Identification Code Sequence"),
    entry(0x0040, 0xA120, VR::DT, "DateTime", "DateTime"),
    entry(0x0040, 0xA121, VR::DA, "Date", "Date"),
    entry(0x0040, 0xA122, VR::TM, "Time", "Time"),
    entry(0x0040, 0xA123, VR::PN, "PersonName", "Person Name"),
    entry(0x0040, 0xA124, VR::UI, "UID", "UID"),
    entry(0x0040, 0xA130, VR::CS, "TemporalRangeType", "Temporal Range Type"),
    entry(0x0040, 0xA132, VR::UL, "ReferencedSamplePositions", "Referenced Sample Positions"),
    entry(0x0040, 0xA136, VR::US, "ReferencedFrameNumbers", "Referenced Frame Numbers"),
    entry(0x0040, 0xA138, VR::DS, "ReferencedTimeOffsets", "Referenced Time Offsets"),
    entry(0x0040, 0xA13A, VR::DT, "ReferencedDateTime", "Referenced DateTime"),
    entry(0x0040, 0xA160, VR::UT, "TextValue", "Text Value"),
    entry(0x0040, 0xA168, VR::SQ, "ConceptCodeSequence", "Concept Code Sequence"),
    entry(0x0040, 0xA170, VR::SQ, "PurposeOfReferenceCodeSequence", "Purpose of Reference Code Sequence"),
    entry(0x0040, 0xA180, VR::US, "AnnotationGroupNumber", "Annotation Group Number"),
    entry(0x0040, 0xA195, VR::SQ, "ModifierCodeSequence", "Modifier Code Sequence"),
    entry(0x0040, 0xA300, VR::SQ, "MeasuredValueSequence", "Measured Value Sequence"),
    entry(0x0040, 0xA30A, VR::DS, "NumericValue", "Numeric Value"),
    entry(0x0040, 0xA360, VR::SQ, "PredecessorDocumentsSequence", "Predecessor Documents Sequence"),
    entry(0x0040, 0xA370, VR::SQ, "ReferencedRequestSequence", "Referenced Request Sequence"),
    entry(0x0040, 0xA372, VR::SQ, "PerformedProcedureCodeSequence", "Performed Procedure Code Sequence"),
    entry(0x0040, 0xA375, VR::SQ, "CurrentRequestedProcedureEvidenceSequence", "Current Requested Procedure Evidence Sequence"),
    entry(0x0040, 0xA385, VR::SQ, "PertinentOtherEvidenceSequence", "Pertinent Other Evidence Sequence"),
    entry(0x0040, 0xA390, VR::SQ, "HL7StructuredDocumentReferenceSequence", "HL7 Structured Document Reference Sequence"),
    entry(0x0040, 0xA491, VR::CS, "CompletionFlag", "Completion Flag"),
    entry(0x0040, 0xA492, VR::LO, "CompletionFlagDescription", "Completion Flag Description"),
    entry(0x0040, 0xA493, VR::CS, "VerificationFlag", "Verification Flag"),
    entry(0x0040, 0xA504, VR::SQ, "ContentTemplateSequence", "Content Template Sequence"),
    entry(0x0040, 0xA525, VR::SQ, "IdenticalDocumentsSequence", "Identical Documents Sequence"),
    entry(0x0040, 0xA730, VR::SQ, "ContentSequence", "Content Sequence"),

    // Device Information (0x0050)
    entry(0x0050, 0x0004, VR::CS, "CalibrationImage", "Calibration Image"),
    entry(0x0050, 0x0010, VR::SQ, "DeviceSequence", "Device Sequence"),
    entry(0x0050, 0x0014, VR::DS, "DeviceLength", "Device Length"),
    entry(0x0050, 0x0016, VR::DS, "DeviceDiameter", "Device Diameter"),
    entry(0x0050, 0x0017, VR::CS, "DeviceDiameterUnits", "Device Diameter Units"),
    entry(0x0050, 0x0018, VR::DS, "DeviceVolume", "Device Volume"),
    entry(0x0050, 0x0019, VR::DS, "InterMarkerDistance", "Inter-Marker Distance"),
    entry(0x0050, 0x0020, VR::LO, "DeviceDescription", "Device Description"),

    // Waveform (0x5400)
    entry(0x5400, 0x0100, VR::SQ, "WaveformSequence", "Waveform Sequence"),
    entry(0x5400, 0x1004, VR::US, "WaveformBitsAllocated", "Waveform Bits Allocated"),
    entry(0x5400, 0x1006, VR::CS, "WaveformSampleInterpretation", "Waveform Sample Interpretation"),
    entry(0x5400, 0x1010, VR::OW, "WaveformData", "Waveform Data"),

    // Pixel Data (0x7FE0)
    entry(0x7FE0, 0x0008, VR::OF, "FloatPixelData", "Float Pixel Data"),
    entry(0x7FE0, 0x0009, VR::OD, "DoubleFloatPixelData", "Double Float Pixel Data"),
    entry(0x7FE0, 0x0010, VR::OW, "PixelData", "Pixel Data"),
    retired(0x7FE0, 0x0020, VR::OW, "CoefficientsSDVN", "Coefficients SDVN"),
    retired(0x7FE0, 0x0030, VR::OW, "CoefficientsSDHN", "Coefficients SDHN"),
    retired(0x7FE0, 0x0040, VR::OW, "CoefficientsSDDN", "Coefficients SDDN"),
};
// clang-format on

}  // namespace

auto get_standard_tags() -> std::span<const tag_info> {
    return standard_tags;
}

}  // namespace metaview::core
