// EN: Fatal error detection from severity and error-type keywords
// FR: Détection des erreurs fatales par sévérité et mots-clés du type d'erreur

#include "workflow/error_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace CKW::Workflow::ErrorClassifier {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool containsFatalKeyword(const std::string& error_type) {
    const std::string lower = toLower(error_type);
    const auto& keywords = fatalKeywords();
    return std::any_of(keywords.begin(), keywords.end(), [&lower](const std::string& keyword) {
        return lower.find(keyword) != std::string::npos;
    });
}

} // namespace

const std::vector<std::string>& fatalKeywords() {
    static const std::vector<std::string> keywords = {
        "authentication_failure",
        "permission_denied",
        "system_error",
        "configuration_invalid",
        "quota_exceeded"
    };
    return keywords;
}

bool isFatal(const WorkflowError& error) {
    if (error.severity == ErrorSeverity::CRITICAL) {
        return true;
    }
    return containsFatalKeyword(error.error_type);
}

bool isFatal(const std::string& severity, const std::string& error_type) {
    if (toLower(severity) == "critical") {
        return true;
    }
    return containsFatalKeyword(error_type);
}

} // namespace CKW::Workflow::ErrorClassifier
