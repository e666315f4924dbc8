//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_SDK_EXECUTION_HPP_INCLUDED
#define DTUI_SDK_EXECUTION_HPP_INCLUDED

#include <functional>
#include <memory>
#include <utility>

namespace dtui
{
namespace sdk
{

/// Abstract interface of a result sender.
///
/// A sender represents a single bus operation. The operation stays alive as long as its sender does:
/// destroying a sender before it has emitted its result cancels the operation, and its receiver is never called.
///
template <typename Result_>
class SenderOf
{
public:
    using Ptr    = std::unique_ptr<SenderOf>;
    using Result = Result_;

    SenderOf(SenderOf&&)                 = delete;
    SenderOf(const SenderOf&)            = delete;
    SenderOf& operator=(SenderOf&&)      = delete;
    SenderOf& operator=(const SenderOf&) = delete;

    virtual ~SenderOf() = default;

    /// Initiates an operation execution by submitting a given receiver to this sender.
    ///
    /// The submit "consumes" the receiver (no longer usable after this call).
    /// The receiver is called at most once, and never from within this `submit` call.
    ///
    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receive = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receive(std::move(result));
        });
    }

protected:
    SenderOf() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // SenderOf

}  // namespace sdk
}  // namespace dtui

#endif  // DTUI_SDK_EXECUTION_HPP_INCLUDED
