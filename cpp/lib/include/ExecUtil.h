/** \file    ExecUtil.h
 *  \brief   The ExecUtil interface.
 *  \author  Dr. Gordon W. Paynter
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2004-2008 Project iVia.
 *  Copyright 2004-2008 The Regents of The University of California.
 *  Copyright 2017-2026 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <string>
#include <unordered_map>
#include <vector>


namespace ExecUtil {


/** \brief  Run a subcommand to completion.
 *  \param  command             The path to the command that should be executed.
 *  \param  args                The arguments for the command, not including the command itself.
 *  \param  new_stdout          An optional replacement file path for stdout.  The file will be truncated.
 *  \param  new_stderr          An optional replacement file path for stderr.  The file will be truncated.
 *  \param  envs                The environment variables to be set in the child process.
 *  \param  working_directory   The working directory to be set in the child process.
 *  \return The exit code of the subcommand.
 *  \throws std::runtime_error if "command" is not executable, if the child could not be started or if it was killed
 *          by a signal.
 */
int Exec(const std::string &command, const std::vector<std::string> &args = std::vector<std::string>{},
         const std::string &new_stdout = "", const std::string &new_stderr = "",
         const std::unordered_map<std::string, std::string> &envs = std::unordered_map<std::string, std::string>(),
         const std::string &working_directory = "");


} // namespace ExecUtil
