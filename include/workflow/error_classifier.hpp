#pragma once

#include "workflow/workflow_types.hpp"

#include <string>
#include <vector>

namespace CKW::Workflow {

// EN: Fatal vs recoverable decision for stage failures. Pure functions, no state.
// FR: Décision fatal / récupérable pour les échecs d'étape. Fonctions pures, sans état.
namespace ErrorClassifier {

// EN: Error-type fragments that make a failure fatal (matched as lower-case substrings).
// FR: Fragments de type d'erreur rendant un échec fatal (sous-chaînes en minuscules).
const std::vector<std::string>& fatalKeywords();

// EN: Critical severity is fatal; otherwise fatal when the lower-cased error type contains a
//     fatal keyword ("oauth_authentication_failure_retry" is fatal).
// FR: La sévérité critique est fatale ; sinon fatal si le type d'erreur en minuscules contient
//     un mot-clé fatal ("oauth_authentication_failure_retry" est fatal).
bool isFatal(const WorkflowError& error);

// EN: Same rule on raw strings, for failures that arrive untyped.
// FR: Même règle sur des chaînes brutes, pour les échecs non typés.
bool isFatal(const std::string& severity, const std::string& error_type);

} // namespace ErrorClassifier
} // namespace CKW::Workflow
