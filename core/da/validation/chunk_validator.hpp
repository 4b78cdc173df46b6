/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "da/types.hpp"
#include "outcome/outcome.hpp"

namespace danode::da {

  /**
   * Decides whether the chunks an operator received for a blob are exactly
   * the ones it is entitled to and open against the blob commitment
   */
  class ChunkValidator {
   public:
    virtual ~ChunkValidator() = default;

    /**
     * Validates every quorum of the blob the operator is a member of
     * @param blob header and bundles received from the disperser
     * @param state operator set snapshot at the reference block
     * @return success or ChunkValidationError
     */
    virtual outcome::result<void> validateBlob(
        const BlobMessage &blob, const OperatorState &state) const = 0;

    /**
     * Replaces the identity used by subsequent validateBlob calls. Calls
     * already running keep the identity they started with.
     */
    virtual void updateOperatorId(const OperatorId &operator_id) = 0;
  };

}  // namespace danode::da
