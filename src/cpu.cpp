/*\
 *  LC-3 Simulator
 *  Copyright (C) 2004  Anthony Liguori <aliguori@cs.utexas.edu>
 *  Modifications 2010  Edgar Lakis <edgar.lakis@gmail.com>
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
\*/

#include "lc3vm/cpu.hpp"
#include "lc3vm/errors.hpp"

namespace LC3VM {

CPU::CPU(Machine &machine, InputChannel &in, OutputChannel &out)
  : machine(machine), traps(machine, in, out)
{
}

void CPU::attach(BusObserver *observer)
{
  observers.push_back(observer);
}

uint16_t CPU::load(uint16_t address)
{
  for (size_t i = 0; i < observers.size(); i++) {
    observers[i]->before_read(machine.mem, address);
  }
  uint16_t value = machine.mem[address];
  for (size_t i = 0; i < observers.size(); i++) {
    observers[i]->after_read(machine.mem, address, value);
  }
  return value;
}

void CPU::store(uint16_t address, uint16_t value)
{
  machine.mem[address] = value;
  for (size_t i = 0; i < observers.size(); i++) {
    observers[i]->wrote(machine.mem, address, value);
  }
}

void CPU::cycle()
{
  RegisterFile &regs = machine.regs;
  uint16_t address = regs.PC;
  uint16_t IR = machine.mem[address];

  for (size_t i = 0; i < observers.size(); i++) {
    observers[i]->fetched(address, IR);
  }

  Instruction inst = decode(IR);
  if (inst.op == OP_TRAP && !TrapDispatcher::implemented(inst.vector)) {
    throw IllegalTrap(inst.vector);
  }

  // Offsets are relative to the next instruction.
  regs.PC = address + 1;
  execute(inst);
  machine.instructions++;
}

void CPU::execute(const Instruction &inst)
{
  RegisterFile &regs = machine.regs;
  uint16_t value;

  switch (inst.op) {
  case OP_ADD:
    value = regs.reg(inst.sr1) + (inst.imm ? (uint16_t)inst.offset : regs.reg(inst.sr2));
    regs.set_reg(inst.dr, value);
    regs.set_flags((int16_t)value);
    break;
  case OP_AND:
    value = regs.reg(inst.sr1) & (inst.imm ? (uint16_t)inst.offset : regs.reg(inst.sr2));
    regs.set_reg(inst.dr, value);
    regs.set_flags((int16_t)value);
    break;
  case OP_NOT:
    value = ~regs.reg(inst.sr1);
    regs.set_reg(inst.dr, value);
    regs.set_flags((int16_t)value);
    break;
  case OP_BR:
    if (inst.nzp & regs.cc()) {
      regs.PC += inst.offset;
    }
    break;
  case OP_JMP:
    regs.PC = regs.reg(inst.base);
    break;
  case OP_JSR:
    // JSRR R7 jumps through the old R7, so read the base first.
    value = inst.imm ? (uint16_t)(regs.PC + inst.offset) : regs.reg(inst.base);
    regs.set_reg(7, regs.PC);
    regs.PC = value;
    break;
  case OP_LD:
    value = load(regs.PC + inst.offset);
    regs.set_reg(inst.dr, value);
    regs.set_flags((int16_t)value);
    break;
  case OP_LDI:
    value = load(load(regs.PC + inst.offset));
    regs.set_reg(inst.dr, value);
    regs.set_flags((int16_t)value);
    break;
  case OP_LDR:
    value = load(regs.reg(inst.base) + inst.offset);
    regs.set_reg(inst.dr, value);
    regs.set_flags((int16_t)value);
    break;
  case OP_LEA:
    value = regs.PC + inst.offset;
    regs.set_reg(inst.dr, value);
    regs.set_flags((int16_t)value);
    break;
  case OP_ST:
    store(regs.PC + inst.offset, regs.reg(inst.dr));
    break;
  case OP_STI:
    store(load(regs.PC + inst.offset), regs.reg(inst.dr));
    break;
  case OP_STR:
    store(regs.reg(inst.base) + inst.offset, regs.reg(inst.dr));
    break;
  case OP_TRAP:
    regs.set_reg(7, regs.PC);
    if (traps.dispatch(inst.vector)) {
      machine.halted = true;
    }
    break;
  case OP_RTI:
  case OP_RES:
    throw IllegalOpcode(inst.op, inst.IR);
  }
}

RunResult CPU::run(const volatile sig_atomic_t *interrupted)
{
  bool stepped = false;
  while (!machine.halted) {
    if (interrupted && *interrupted) {
      return RunResult(Interrupted, 0, machine.regs.PC);
    }
    try {
      cycle();
      stepped = true;
    } catch (IllegalOpcode &e) {
      return RunResult(UnimplementedOpcode, e.opcode(), machine.regs.PC);
    } catch (IllegalTrap &e) {
      return RunResult(UnimplementedTrap, e.vector(), machine.regs.PC);
    }
  }
  // PC points past the HALT, unless the machine was halted on entry.
  return RunResult(Halted, TRAP_HALT,
                   stepped ? machine.regs.PC - 1 : machine.regs.PC);
}

}

// vim: sw=2 si:
