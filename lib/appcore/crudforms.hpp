/**
 * @file crudforms.hpp
 * @brief Dialog contents and remote calls of each CRUD operation
 *
 * loadCrudForm() and submitCrud() perform network I/O and run inside
 * effects. The remaining functions are pure.
 */

#ifndef CRUDFORMS_HPP
#define CRUDFORMS_HPP

#include <optional>
#include <string>

#include "crudflow.hpp"
#include "formtypes.hpp"
#include "iresourceclient.hpp"
#include "result.hpp"

/** @brief True when the dialog needs data from the server first */
bool needsRemoteState(const CrudRequest &request);

/** @brief Builds the wizard of a Create or Edit request */
Result<WizardSpec> loadCrudForm(IResourceClient &client,
                                const CrudRequest &request);

/** @brief Empty message when @p values can be submitted */
std::string validateCrudForm(const CrudRequest &request,
                             const FormValues &values);

/** @brief Applies a confirmed request to the server */
Status submitCrud(IResourceClient &client, const CrudRequest &request,
                  const FormValues &values);

/** @brief Text of the confirmation shown before Delete and Publish */
std::string crudConfirmText(const CrudRequest &request);

/**
 * @brief Where the cursor should land after a successful operation
 *
 * The created or renamed resource, the parent category after a delete,
 * nullopt to keep the previous cursor.
 */
std::optional<TreePath> crudResultPath(const CrudRequest &request,
                                       const FormValues &values);

#endif // CRUDFORMS_HPP
