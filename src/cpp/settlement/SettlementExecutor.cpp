/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/settlement/SettlementExecutor.hpp"

#include "dealcore/logging/Logging.hpp"

//-------------------------------------------------------------------------

namespace dealcore::settlement
{

//-------------------------------------------------------------------------

SettlementExecutor::SettlementExecutor(const SettlementExecutorDesc& desc) noexcept
    : m_ledger{desc.ledger},
      m_inventory{desc.inventory},
      m_messenger{desc.messenger},
      m_journal{desc.journal},
      m_clock{desc.clock},
      m_signals{desc.signals},
      m_logger{logging::get()}
{}

//-------------------------------------------------------------------------

ExecutionOutcome SettlementExecutor::run(Settlement& settlement)
{
    if (!settlement.claim(m_clock.now())) {
        m_logger->debug("{} '{}' is already claimed", settlement.kind(), settlement.id());
        return {.status = ExecutionStatus::ALREADY_CLAIMED};
    }
    m_logger->info("Claimed {} '{}' for execution", settlement.kind(), settlement.id());

    const auto order = settlement.transferOrder();
    const auto receipt = order.has_value()
        ? dispatch(order.value())
        : std::expected<TransferId, std::string>{std::unexpect, order.error()};
    if (!receipt.has_value()) {
        recordFailure(settlement, receipt.error());
        return {.status = ExecutionStatus::FAILED, .failureNote = receipt.error()};
    }

    const auto now = m_clock.now();
    try {
        settlement.complete(receipt.value(), now);
    }
    catch (const std::exception& exc) {
        m_logger->critical(
            "Transfer '{}' for {} '{}' went out but could not be recorded; "
            "the claim stays in place for reconciliation: {}",
            receipt.value(), settlement.kind(), settlement.id(), exc.what());
        throw;
    }
    m_logger->info(
        "Completed {} '{}' with transfer '{}'", settlement.kind(), settlement.id(), receipt.value());

    try {
        m_journal.append(settlement.journalEntry(receipt.value(), now));
    }
    catch (const std::exception& exc) {
        m_logger->error(
            "Journal entry for {} '{}' was not written: {}",
            settlement.kind(), settlement.id(), exc.what());
    }

    emit(&SettlementSignals::settled, {
        .settlementId = settlement.id(),
        .kind = std::string{settlement.kind()},
        .status = ExecutionStatus::COMPLETED,
        .transferId = receipt.value(),
        .timestamp = now
    });
    if (const auto notice = settlement.completionNotice(receipt.value())) {
        notify(notice.value());
    }
    return {.status = ExecutionStatus::COMPLETED, .transferId = receipt.value()};
}

//-------------------------------------------------------------------------

void SettlementExecutor::notify(const Notice& notice) noexcept
{
    try {
        m_messenger.notify(notice.channel, notice.text);
    }
    catch (const std::exception& exc) {
        m_logger->warn("Notification to '{}' was not delivered: {}", notice.channel, exc.what());
    }
}

//-------------------------------------------------------------------------

std::expected<TransferId, std::string> SettlementExecutor::dispatch(const TransferOrder& order)
{
    try {
        return std::visit(
            [this](const auto& concreteOrder) {
                using T = std::decay_t<decltype(concreteOrder)>;
                if constexpr (std::same_as<T, CurrencyTransfer>) {
                    return sendCurrency(concreteOrder);
                } else {
                    return sendItem(concreteOrder);
                }
            },
            order);
    }
    catch (const std::exception& exc) {
        return std::unexpected{fmt::format("Transfer raised an error: {}", exc.what())};
    }
}

//-------------------------------------------------------------------------

std::expected<TransferId, std::string> SettlementExecutor::sendCurrency(
    const CurrencyTransfer& order)
{
    m_logger->info("Sending {} to '{}' ({})", order.amount, order.destination, order.memo);
    return m_ledger.submitTransfer(order.destination, order.amount, order.memo);
}

//-------------------------------------------------------------------------

std::expected<TransferId, std::string> SettlementExecutor::sendItem(const ItemTransfer& order)
{
    m_logger->info("Transferring item '{}' to '{}'", order.itemRef, order.destination);

    const auto first = m_inventory.transferItem(order.itemRef, order.destination);
    if (!first.has_value()) {
        return std::unexpected{first.error()};
    }
    if (const auto receipt = std::get_if<TransferId>(&first.value())) {
        return *receipt;
    }

    const auto& payment = std::get<collaborators::PaymentRequired>(first.value());
    m_logger->info(
        "Transfer of '{}' requires a fee (invoice '{}'{})",
        order.itemRef,
        payment.invoiceId,
        payment.fee ? fmt::format(", {}", *payment.fee) : "");
    if (const auto paid = m_inventory.payTransferFee(payment); !paid.has_value()) {
        return std::unexpected{fmt::format(
            "Fee payment for invoice '{}' failed: {}", payment.invoiceId, paid.error())};
    }

    const auto second = m_inventory.transferItem(order.itemRef, order.destination);
    if (!second.has_value()) {
        return std::unexpected{second.error()};
    }
    if (const auto receipt = std::get_if<TransferId>(&second.value())) {
        return *receipt;
    }
    return std::unexpected{fmt::format(
        "Platform still demands payment for '{}' after invoice '{}' was paid",
        order.itemRef, payment.invoiceId)};
}

//-------------------------------------------------------------------------

void SettlementExecutor::recordFailure(Settlement& settlement, const std::string& note)
{
    const auto now = m_clock.now();
    m_logger->error("{} '{}' failed: {}", settlement.kind(), settlement.id(), note);

    settlement.fail(note, now);

    emit(&SettlementSignals::failed, {
        .settlementId = settlement.id(),
        .kind = std::string{settlement.kind()},
        .status = ExecutionStatus::FAILED,
        .note = note,
        .timestamp = now
    });
    if (const auto notice = settlement.failureNotice(note)) {
        notify(notice.value());
    }
}

//-------------------------------------------------------------------------

void SettlementExecutor::emit(
    bs2::signal<void(const SettlementEvent&)> SettlementSignals::*signal,
    const SettlementEvent& event) noexcept
{
    if (m_signals == nullptr) return;
    try {
        (m_signals->*signal)(event);
    }
    catch (const std::exception& exc) {
        m_logger->warn("Settlement event subscriber raised an error: {}", exc.what());
    }
}

//-------------------------------------------------------------------------

}  // namespace dealcore::settlement

//-------------------------------------------------------------------------
